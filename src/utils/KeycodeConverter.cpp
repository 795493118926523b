#include "utils/KeycodeConverter.h"
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef __linux__
#include <linux/input-event-codes.h>
#endif

namespace EdgeShare::Utils {

namespace {

using KeyTable = std::vector<std::pair<uint16_t, uint16_t>>;

#ifdef __linux__
// evdev code -> VK. Order matters for the reverse lookup.
const KeyTable& evdevTable() {
    static const KeyTable table = {
        {KEY_ESC, VK_ESCAPE}, {KEY_1, '1'}, {KEY_2, '2'}, {KEY_3, '3'}, {KEY_4, '4'}, {KEY_5, '5'},
        {KEY_6, '6'}, {KEY_7, '7'}, {KEY_8, '8'}, {KEY_9, '9'}, {KEY_0, '0'},
        {KEY_MINUS, VK_OEM_MINUS}, {KEY_EQUAL, VK_OEM_PLUS},
        {KEY_BACKSPACE, VK_BACK}, {KEY_TAB, VK_TAB},
        {KEY_Q, 'Q'}, {KEY_W, 'W'}, {KEY_E, 'E'}, {KEY_R, 'R'}, {KEY_T, 'T'}, {KEY_Y, 'Y'},
        {KEY_U, 'U'}, {KEY_I, 'I'}, {KEY_O, 'O'}, {KEY_P, 'P'},
        {KEY_LEFTBRACE, VK_OEM_4}, {KEY_RIGHTBRACE, VK_OEM_6}, {KEY_ENTER, VK_RETURN},
        {KEY_LEFTCTRL, VK_LCONTROL}, {KEY_A, 'A'}, {KEY_S, 'S'}, {KEY_D, 'D'}, {KEY_F, 'F'},
        {KEY_G, 'G'}, {KEY_H, 'H'}, {KEY_J, 'J'}, {KEY_K, 'K'}, {KEY_L, 'L'},
        {KEY_SEMICOLON, VK_OEM_1}, {KEY_APOSTROPHE, VK_OEM_7}, {KEY_GRAVE, VK_OEM_3},
        {KEY_LEFTSHIFT, VK_LSHIFT}, {KEY_BACKSLASH, VK_OEM_5},
        {KEY_Z, 'Z'}, {KEY_X, 'X'}, {KEY_C, 'C'}, {KEY_V, 'V'}, {KEY_B, 'B'}, {KEY_N, 'N'},
        {KEY_M, 'M'}, {KEY_COMMA, VK_OEM_COMMA}, {KEY_DOT, VK_OEM_PERIOD}, {KEY_SLASH, VK_OEM_2},
        {KEY_RIGHTSHIFT, VK_RSHIFT}, {KEY_KPASTERISK, VK_MULTIPLY},
        {KEY_LEFTALT, VK_LMENU}, {KEY_SPACE, VK_SPACE}, {KEY_CAPSLOCK, VK_CAPITAL},
        {KEY_F1, VK_F1}, {KEY_F2, VK_F2}, {KEY_F3, VK_F3}, {KEY_F4, VK_F4}, {KEY_F5, VK_F5},
        {KEY_F6, VK_F6}, {KEY_F7, VK_F7}, {KEY_F8, VK_F8}, {KEY_F9, VK_F9}, {KEY_F10, VK_F10},
        {KEY_F11, VK_F11}, {KEY_F12, VK_F12},
        {KEY_NUMLOCK, VK_NUMLOCK}, {KEY_SCROLLLOCK, VK_SCROLL},
        {KEY_KP7, VK_NUMPAD7}, {KEY_KP8, VK_NUMPAD8}, {KEY_KP9, VK_NUMPAD9}, {KEY_KPMINUS, VK_SUBTRACT},
        {KEY_KP4, VK_NUMPAD4}, {KEY_KP5, VK_NUMPAD5}, {KEY_KP6, VK_NUMPAD6}, {KEY_KPPLUS, VK_ADD},
        {KEY_KP1, VK_NUMPAD1}, {KEY_KP2, VK_NUMPAD2}, {KEY_KP3, VK_NUMPAD3},
        {KEY_KP0, VK_NUMPAD0}, {KEY_KPDOT, VK_DECIMAL},
        {KEY_KPENTER, VK_RETURN},
        {KEY_RIGHTCTRL, VK_RCONTROL}, {KEY_KPSLASH, VK_DIVIDE},
        {KEY_SYSRQ, VK_SNAPSHOT},
        {KEY_RIGHTALT, VK_RMENU},
        {KEY_HOME, VK_HOME}, {KEY_UP, VK_UP}, {KEY_PAGEUP, VK_PRIOR}, {KEY_LEFT, VK_LEFT},
        {KEY_RIGHT, VK_RIGHT}, {KEY_END, VK_END}, {KEY_DOWN, VK_DOWN}, {KEY_PAGEDOWN, VK_NEXT},
        {KEY_INSERT, VK_INSERT}, {KEY_DELETE, VK_DELETE},
        {KEY_MUTE, VK_VOLUME_MUTE}, {KEY_VOLUMEDOWN, VK_VOLUME_DOWN}, {KEY_VOLUMEUP, VK_VOLUME_UP},
        {KEY_POWER, VK_POWER},
        {KEY_KPEQUAL, VK_OEM_PLUS},
        {KEY_PAUSE, VK_PAUSE},
        {KEY_KPCOMMA, VK_SEPARATOR},
        {KEY_LEFTMETA, VK_LWIN}, {KEY_RIGHTMETA, VK_RWIN}, {KEY_COMPOSE, VK_APPS},

        {BTN_LEFT, VK_LBUTTON},
        {BTN_RIGHT, VK_RBUTTON},
        {BTN_MIDDLE, VK_MBUTTON},
        {BTN_SIDE, VK_XBUTTON1},
        {BTN_EXTRA, VK_XBUTTON2},
    };
    return table;
}

// Generic modifiers resolve to the left-hand key when injected.
const KeyTable& evdevAliases() {
    static const KeyTable aliases = {
        {VK_SHIFT, KEY_LEFTSHIFT},
        {VK_CONTROL, KEY_LEFTCTRL},
        {VK_MENU, KEY_LEFTALT},
    };
    return aliases;
}
#else
const KeyTable& evdevTable() {
    static const KeyTable table;
    return table;
}

const KeyTable& evdevAliases() {
    static const KeyTable aliases;
    return aliases;
}
#endif

// macOS virtual key code (CGKeyCode) -> VK. Left and right modifiers collapse
// onto the generic VK; the left key is listed first and wins on the way back.
const KeyTable& macTable() {
    static const KeyTable table = {
        {0, 'A'}, {1, 'S'}, {2, 'D'}, {3, 'F'}, {4, 'H'}, {5, 'G'}, {6, 'Z'}, {7, 'X'},
        {8, 'C'}, {9, 'V'}, {11, 'B'}, {12, 'Q'}, {13, 'W'}, {14, 'E'}, {15, 'R'},
        {16, 'Y'}, {17, 'T'}, {18, '1'}, {19, '2'}, {20, '3'}, {21, '4'}, {22, '6'},
        {23, '5'}, {24, VK_OEM_PLUS}, {25, '9'}, {26, '7'}, {27, VK_OEM_MINUS}, {28, '8'},
        {29, '0'}, {30, VK_OEM_6}, {31, 'O'}, {32, 'U'}, {33, VK_OEM_4}, {34, 'I'},
        {35, 'P'}, {36, VK_RETURN}, {37, 'L'}, {38, 'J'}, {39, VK_OEM_7}, {40, 'K'},
        {41, VK_OEM_1}, {42, VK_OEM_5}, {43, VK_OEM_COMMA}, {44, VK_OEM_2}, {45, 'N'},
        {46, 'M'}, {47, VK_OEM_PERIOD}, {48, VK_TAB}, {49, VK_SPACE}, {50, VK_OEM_3},
        {51, VK_BACK}, {53, VK_ESCAPE},
        {55, VK_LWIN}, {54, VK_RWIN},
        {56, VK_SHIFT}, {60, VK_SHIFT},
        {57, VK_CAPITAL},
        {58, VK_MENU}, {61, VK_MENU},
        {59, VK_CONTROL}, {62, VK_CONTROL},
        {122, VK_F1}, {120, VK_F2}, {99, VK_F3}, {118, VK_F4}, {96, VK_F5}, {97, VK_F6},
        {98, VK_F7}, {100, VK_F8}, {101, VK_F9}, {109, VK_F10}, {103, VK_F11}, {111, VK_F12},
        {115, VK_HOME}, {116, VK_PRIOR}, {117, VK_DELETE}, {119, VK_END}, {121, VK_NEXT},
        {123, VK_LEFT}, {124, VK_RIGHT}, {125, VK_DOWN}, {126, VK_UP},
        {65, VK_DECIMAL}, {67, VK_MULTIPLY}, {69, VK_ADD}, {75, VK_DIVIDE}, {76, VK_RETURN},
        {78, VK_SUBTRACT}, {82, VK_NUMPAD0}, {83, VK_NUMPAD1}, {84, VK_NUMPAD2},
        {85, VK_NUMPAD3}, {86, VK_NUMPAD4}, {87, VK_NUMPAD5}, {88, VK_NUMPAD6},
        {89, VK_NUMPAD7}, {91, VK_NUMPAD8}, {92, VK_NUMPAD9},
    };
    return table;
}

// Left/right modifier VKs reaching a Mac land on the single generic key.
const KeyTable& macAliases() {
    static const KeyTable aliases = {
        {VK_LSHIFT, 56}, {VK_RSHIFT, 60},
        {VK_LCONTROL, 59}, {VK_RCONTROL, 62},
        {VK_LMENU, 58}, {VK_RMENU, 61},
    };
    return aliases;
}

struct Lookup {
    std::unordered_map<uint16_t, uint16_t> forward;
    std::unordered_map<uint16_t, uint16_t> reverse;
};

Lookup buildLookup(const KeyTable& table, const KeyTable& aliases) {
    Lookup lookup;
    for (const auto& entry : table) {
        // emplace keeps the first registration on both sides
        lookup.forward.emplace(entry.first, entry.second);
        lookup.reverse.emplace(entry.second, entry.first);
    }
    for (const auto& alias : aliases) {
        lookup.reverse.emplace(alias.first, alias.second);
    }
    return lookup;
}

const Lookup* lookupFor(Platform platform) {
    static const Lookup linuxLookup = buildLookup(evdevTable(), evdevAliases());
    static const Lookup macLookup = buildLookup(macTable(), macAliases());
    switch (platform) {
        case Platform::Linux: return &linuxLookup;
        case Platform::MacOS: return &macLookup;
        case Platform::Windows: return nullptr;
    }
    return nullptr;
}

}

std::string platformToString(Platform platform) {
    switch (platform) {
        case Platform::Linux: return "linux";
        case Platform::MacOS: return "macos";
        case Platform::Windows: return "windows";
    }
    return "unknown";
}

uint16_t KeycodeConverter::toCanonical(Platform platform, uint16_t localCode) {
    const Lookup* lookup = lookupFor(platform);
    if (!lookup) {
        return localCode;
    }
    auto it = lookup->forward.find(localCode);
    return it != lookup->forward.end() ? it->second : localCode;
}

uint16_t KeycodeConverter::fromCanonical(Platform platform, uint16_t canonicalCode) {
    const Lookup* lookup = lookupFor(platform);
    if (!lookup) {
        return canonicalCode;
    }
    auto it = lookup->reverse.find(canonicalCode);
    return it != lookup->reverse.end() ? it->second : canonicalCode;
}

uint8_t KeycodeConverter::evdevToVk(uint16_t evdevCode) {
    const Lookup* lookup = lookupFor(Platform::Linux);
    auto it = lookup->forward.find(evdevCode);
    if (it != lookup->forward.end()) {
        return static_cast<uint8_t>(it->second);
    }
    return 0;
}

uint16_t KeycodeConverter::vkToEvdev(uint8_t vkCode) {
    const Lookup* lookup = lookupFor(Platform::Linux);
    auto it = lookup->reverse.find(vkCode);
    if (it != lookup->reverse.end()) {
        return it->second;
    }
    return 0;
}

bool KeycodeConverter::isVkMouseButton(uint8_t vkCode) {
    switch (vkCode) {
        case VK_LBUTTON:
        case VK_RBUTTON:
        case VK_MBUTTON:
        case VK_XBUTTON1:
        case VK_XBUTTON2:
            return true;
        default:
            return false;
    }
}

bool KeycodeConverter::isVkModifier(uint8_t vkCode) {
    switch (vkCode) {
        case VK_SHIFT: case VK_LSHIFT: case VK_RSHIFT:
        case VK_CONTROL: case VK_LCONTROL: case VK_RCONTROL:
        case VK_MENU: case VK_LMENU: case VK_RMENU:
        case VK_LWIN: case VK_RWIN:
            return true;
        default:
            return false;
    }
}

Platform KeycodeConverter::hostPlatform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

}
