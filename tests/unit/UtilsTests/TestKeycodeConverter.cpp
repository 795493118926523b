#include <gtest/gtest.h>

#include "utils/KeycodeConverter.h"

#ifdef __linux__
#include <linux/input-event-codes.h>
#endif

using namespace EdgeShare::Utils;

TEST(KeycodeConverter, MacLettersMapToAsciiVk)
{
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 0), 'A');
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 46), 'M');
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::MacOS, 'A'), 0);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::MacOS, 'M'), 46);
}

TEST(KeycodeConverter, MacFunctionKeys)
{
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 122), VK_F1);
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 120), VK_F2);
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 111), VK_F12);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::MacOS, VK_F5), 96);
}

TEST(KeycodeConverter, MacModifiersCollapseToGenericVk)
{
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 56), VK_SHIFT);
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 60), VK_SHIFT);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::MacOS, VK_SHIFT), 56);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::MacOS, VK_RSHIFT), 60);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::MacOS, VK_LCONTROL), 59);
}

TEST(KeycodeConverter, UnknownCodesPassThrough)
{
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::MacOS, 250), 250);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::MacOS, 0xE9), 0xE9);
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::Windows, 0x41), 0x41);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::Windows, VK_LSHIFT), VK_LSHIFT);
}

TEST(KeycodeConverter, ModifierAndButtonClassification)
{
    EXPECT_TRUE(KeycodeConverter::isVkModifier(VK_CONTROL));
    EXPECT_TRUE(KeycodeConverter::isVkModifier(VK_RWIN));
    EXPECT_FALSE(KeycodeConverter::isVkModifier('M'));
    EXPECT_TRUE(KeycodeConverter::isVkMouseButton(VK_XBUTTON2));
    EXPECT_FALSE(KeycodeConverter::isVkMouseButton(VK_SPACE));
}

#ifdef __linux__
TEST(KeycodeConverter, EvdevRoundTrip)
{
    const uint16_t codes[] = {KEY_A, KEY_Z, KEY_ENTER, KEY_LEFTSHIFT, KEY_RIGHTCTRL, KEY_F11, KEY_KP5, KEY_LEFTMETA};
    for (uint16_t code : codes) {
        uint16_t vk = KeycodeConverter::toCanonical(Platform::Linux, code);
        EXPECT_NE(vk, code);
        EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::Linux, vk), code) << "evdev " << code;
    }
    EXPECT_EQ(KeycodeConverter::evdevToVk(KEY_M), 'M');
    EXPECT_EQ(KeycodeConverter::vkToEvdev('M'), KEY_M);
    EXPECT_EQ(KeycodeConverter::evdevToVk(KEY_PROG1), 0);
}

TEST(KeycodeConverter, EvdevCollisionsResolveToFirstEntry)
{
    EXPECT_EQ(KeycodeConverter::toCanonical(Platform::Linux, KEY_KPENTER), VK_RETURN);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::Linux, VK_RETURN), KEY_ENTER);
}

TEST(KeycodeConverter, GenericModifiersInjectAsLeftKeys)
{
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::Linux, VK_SHIFT), KEY_LEFTSHIFT);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::Linux, VK_CONTROL), KEY_LEFTCTRL);
    EXPECT_EQ(KeycodeConverter::fromCanonical(Platform::Linux, VK_MENU), KEY_LEFTALT);
}
#endif
