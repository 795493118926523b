#include <gtest/gtest.h>

#include "network/Message.h"
#include "utils/KeycodeConverter.h"

#include <string>
#include <vector>

using namespace EdgeShare;
using namespace EdgeShare::Network;

namespace
{
    WireMessage RoundTrip(const WireMessage& message)
    {
        std::string line = encode(message);
        EXPECT_EQ(line.back(), '\n');
        EXPECT_EQ(line.find('\n'), line.size() - 1);
        auto decoded = decodeLine(line);
        EXPECT_TRUE(decoded.has_value()) << line;
        return decoded.value_or(WireMessage{Unknown{"<decode failed>"}});
    }
}

TEST(Message, EveryMessageTypeSurvivesEncoding)
{
    std::vector<WireMessage> messages{
        Hello{"1.0", "desk-left"},
        Connected{},
        Ping{},
        Pong{},
        ModeSwitch{true, false, 50, 540},
        ModeSwitch{false, true, std::nullopt, std::nullopt},
        MouseMove{-12, 1079, 1700000000123},
        MouseButton{MouseButtonId::Forward, PressAction::Up, 5, 6, 42},
        MouseScroll{0, -240, 7},
        Key{VK_LSHIFT, PressAction::Down, KeyModifiers{true, false, true, false}, 99},
        ScreenInfo{Core::ScreenLayout{Core::ScreenRect{0, 0, 1920, 1080, true},
                                      Core::ScreenRect{-1280, 100, 1280, 1024, false}}},
        ErrorMessage{"protocol version mismatch"},
    };

    for (const auto& message : messages) {
        EXPECT_EQ(RoundTrip(message), message) << messageTypeName(message);
    }
}

TEST(Message, TypeFieldUsesWireNames)
{
    EXPECT_NE(encode(ModeSwitch{true}).find("\"type\":\"mode_switch\""), std::string::npos);
    EXPECT_NE(encode(MouseScroll{}).find("\"type\":\"mouse_scroll\""), std::string::npos);
    EXPECT_NE(encode(ScreenInfo{}).find("\"screens\":[]"), std::string::npos);
    EXPECT_EQ(messageTypeName(Unknown{"clipboard"}), "unknown(clipboard)");
}

TEST(Message, DecodesHandWrittenLine)
{
    auto decoded = decodeLine("{\"type\":\"mouse_button\",\"button\":\"middle\",\"action\":\"down\",\"x\":10,\"y\":20}\r\n");
    ASSERT_TRUE(decoded.has_value());
    auto* button = std::get_if<MouseButton>(&*decoded);
    ASSERT_NE(button, nullptr);
    EXPECT_EQ(button->button, MouseButtonId::Middle);
    EXPECT_EQ(button->action, PressAction::Down);
    EXPECT_EQ(button->x, 10);
    EXPECT_EQ(button->timestamp, 0);
}

TEST(Message, UnknownTypeIsReportedNotRejected)
{
    auto decoded = decodeLine("{\"type\":\"clipboard\",\"data\":\"hi\"}");
    ASSERT_TRUE(decoded.has_value());
    auto* unknown = std::get_if<Unknown>(&*decoded);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->type, "clipboard");
}

TEST(Message, MalformedLinesAreRejected)
{
    EXPECT_FALSE(decodeLine("").has_value());
    EXPECT_FALSE(decodeLine("not json").has_value());
    EXPECT_FALSE(decodeLine("{\"type\":\"ping\"").has_value());
    EXPECT_FALSE(decodeLine("[1,2,3]").has_value());
    EXPECT_FALSE(decodeLine("{\"name\":\"no type\"}").has_value());
    EXPECT_FALSE(decodeLine("{\"type\":7}").has_value());
}

TEST(Message, MissingRequiredFieldsAreRejected)
{
    EXPECT_FALSE(decodeLine("{\"type\":\"mode_switch\"}").has_value());
    EXPECT_FALSE(decodeLine("{\"type\":\"mouse_move\",\"x\":1}").has_value());
    EXPECT_FALSE(decodeLine("{\"type\":\"mouse_button\",\"button\":\"thumb\",\"action\":\"down\"}").has_value());
    EXPECT_FALSE(decodeLine("{\"type\":\"key\",\"action\":\"down\"}").has_value());
    EXPECT_FALSE(decodeLine("{\"type\":\"key\",\"keyCode\":70000,\"action\":\"down\"}").has_value());
    EXPECT_FALSE(decodeLine("{\"type\":\"screen_info\",\"screens\":[{\"width\":10}]}").has_value());
}

TEST(Message, ScreenEntriesOutsideCoordinateRangeAreRejected)
{
    EXPECT_FALSE(decodeLine("{\"type\":\"screen_info\",\"screens\":"
                            "[{\"x\":2147483000,\"y\":0,\"width\":2000,\"height\":1080}]}")
                     .has_value());
    EXPECT_FALSE(decodeLine("{\"type\":\"screen_info\",\"screens\":"
                            "[{\"x\":0,\"y\":-2147483000,\"width\":1920,\"height\":1080}]}")
                     .has_value());

    auto decoded = decodeLine("{\"type\":\"screen_info\",\"screens\":"
                              "[{\"x\":-1920,\"y\":0,\"width\":1920,\"height\":1080}]}");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<ScreenInfo>(*decoded).screens[0].x, -1920);
}

TEST(Message, DeeplyNestedLinesDoNotExhaustTheStack)
{
    std::string unclosed(1000000, '[');
    EXPECT_FALSE(decodeLine(unclosed).has_value());

    const size_t depth = 400000;
    std::string nested = "{\"type\":\"ping\",\"extra\":" + std::string(depth, '[') + std::string(depth, ']') + "}";
    auto decoded = decodeLine(nested);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (WireMessage{Ping{}}));

    MessageDecoder decoder;
    decoder.feed(std::string(MessageDecoder::MAX_LINE_LENGTH - 1, '[') + "\n" + encode(Pong{}));
    auto messages = decoder.drain();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], (WireMessage{Pong{}}));
    EXPECT_EQ(decoder.droppedLines(), 1u);
}

TEST(Message, OptionalFieldsTakeDefaults)
{
    auto decoded = decodeLine("{\"type\":\"mode_switch\",\"active\":true,\"x\":4}");
    ASSERT_TRUE(decoded.has_value());
    const auto& ms = std::get<ModeSwitch>(*decoded);
    EXPECT_TRUE(ms.active);
    EXPECT_FALSE(ms.ack);
    EXPECT_FALSE(ms.x.has_value());
    EXPECT_FALSE(ms.y.has_value());

    decoded = decodeLine("{\"type\":\"hello\"}");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<Hello>(*decoded).version, PROTOCOL_VERSION);
}

TEST(Message, FractionalCoordinatesAreRounded)
{
    auto decoded = decodeLine("{\"type\":\"mouse_move\",\"x\":10.6,\"y\":-3.2}");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<MouseMove>(*decoded).x, 11);
    EXPECT_EQ(std::get<MouseMove>(*decoded).y, -3);
}

TEST(MessageDecoder, BuffersPartialLines)
{
    MessageDecoder decoder;
    std::string line = encode(MouseMove{100, 200, 1});

    decoder.feed(line.substr(0, 10));
    EXPECT_TRUE(decoder.drain().empty());
    EXPECT_EQ(decoder.bufferedBytes(), 10u);

    decoder.feed(line.substr(10) + encode(Ping{}) + "{\"type\":\"po");
    auto messages = decoder.drain();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], (WireMessage{MouseMove{100, 200, 1}}));
    EXPECT_EQ(messages[1], (WireMessage{Ping{}}));

    decoder.feed("ng\"}\n");
    messages = decoder.drain();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], (WireMessage{Pong{}}));
    EXPECT_EQ(decoder.bufferedBytes(), 0u);
}

TEST(MessageDecoder, BadLinesAreCountedAndSkipped)
{
    MessageDecoder decoder;
    decoder.feed("garbage\n\n" + encode(Connected{}) + "{\"type\":\"mouse_move\"}\n");
    auto messages = decoder.drain();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], (WireMessage{Connected{}}));
    EXPECT_EQ(decoder.droppedLines(), 2u);
}

TEST(MessageDecoder, OverlongLineIsDiscardedUntilNewline)
{
    MessageDecoder decoder;
    std::string huge(MessageDecoder::MAX_LINE_LENGTH + 16, 'x');

    decoder.feed(huge);
    EXPECT_EQ(decoder.bufferedBytes(), 0u);
    EXPECT_EQ(decoder.droppedLines(), 1u);

    decoder.feed("still the same line\n" + encode(Ping{}));
    auto messages = decoder.drain();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], (WireMessage{Ping{}}));

    decoder.reset();
    EXPECT_EQ(decoder.droppedLines(), 0u);
}
