#include "network/Message.h"
#include "utils/Logger.h"

#include <cereal/archives/json.hpp>
#include <cereal/external/rapidjson/document.h>
#include <cereal/external/rapidjson/stringbuffer.h>
#include <cereal/external/rapidjson/writer.h>

#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>
#include <type_traits>

namespace EdgeShare::Network {

namespace {

namespace rj = CEREAL_RAPIDJSON_NAMESPACE;
using JsonWriter = rj::Writer<rj::StringBuffer>;

template <class> inline constexpr bool always_false_v = false;

void writeString(JsonWriter& w, const char* key, const std::string& value) {
    w.Key(key);
    w.String(value.c_str(), static_cast<rj::SizeType>(value.size()));
}

void writeType(JsonWriter& w, const char* type) {
    w.Key("type");
    w.String(type);
}

std::optional<int64_t> readInt64(const rj::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        return std::nullopt;
    }
    const rj::Value& v = it->value;
    if (v.IsInt64()) {
        return v.GetInt64();
    }
    if (v.IsDouble()) {
        double d = v.GetDouble();
        if (std::isfinite(d) && d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(std::llround(d));
        }
    }
    return std::nullopt;
}

std::optional<int32_t> readInt32(const rj::Value& obj, const char* name) {
    auto value = readInt64(obj, name);
    if (!value || *value < std::numeric_limits<int32_t>::min() || *value > std::numeric_limits<int32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<int32_t>(*value);
}

std::optional<bool> readBool(const rj::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsBool()) {
        return std::nullopt;
    }
    return it->value.GetBool();
}

std::optional<std::string> readString(const rj::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

void protocolError(const std::string& type, const std::string& detail) {
    Utils::Logger::GetInstance().Warning("Protocol: dropping '" + type + "' message: " + detail);
}

std::optional<WireMessage> decodeObject(const rj::Value& doc, const std::string& type) {
    if (type == "hello") {
        Hello hello;
        hello.version = readString(doc, "version").value_or(PROTOCOL_VERSION);
        hello.name = readString(doc, "name").value_or("");
        return WireMessage{hello};
    }
    if (type == "connected") {
        return WireMessage{Connected{}};
    }
    if (type == "ping") {
        return WireMessage{Ping{}};
    }
    if (type == "pong") {
        return WireMessage{Pong{}};
    }
    if (type == "mode_switch") {
        auto active = readBool(doc, "active");
        if (!active) {
            protocolError(type, "missing 'active'");
            return std::nullopt;
        }
        ModeSwitch ms;
        ms.active = *active;
        ms.ack = readBool(doc, "ack").value_or(false);
        ms.x = readInt32(doc, "x");
        ms.y = readInt32(doc, "y");
        if (ms.x.has_value() != ms.y.has_value()) {
            ms.x.reset();
            ms.y.reset();
        }
        return WireMessage{ms};
    }
    if (type == "mouse_move") {
        auto x = readInt32(doc, "x");
        auto y = readInt32(doc, "y");
        if (!x || !y) {
            protocolError(type, "missing 'x' or 'y'");
            return std::nullopt;
        }
        return WireMessage{MouseMove{*x, *y, readInt64(doc, "timestamp").value_or(0)}};
    }
    if (type == "mouse_button") {
        auto buttonName = readString(doc, "button");
        auto actionName = readString(doc, "action");
        std::optional<MouseButtonId> button = buttonName ? mouseButtonFromString(*buttonName) : std::nullopt;
        std::optional<PressAction> action = actionName ? pressActionFromString(*actionName) : std::nullopt;
        if (!button || !action) {
            protocolError(type, "missing or invalid 'button'/'action'");
            return std::nullopt;
        }
        MouseButton mb;
        mb.button = *button;
        mb.action = *action;
        mb.x = readInt32(doc, "x").value_or(0);
        mb.y = readInt32(doc, "y").value_or(0);
        mb.timestamp = readInt64(doc, "timestamp").value_or(0);
        return WireMessage{mb};
    }
    if (type == "mouse_scroll") {
        MouseScroll scroll;
        scroll.deltaX = readInt32(doc, "deltaX").value_or(0);
        scroll.deltaY = readInt32(doc, "deltaY").value_or(0);
        scroll.timestamp = readInt64(doc, "timestamp").value_or(0);
        return WireMessage{scroll};
    }
    if (type == "key") {
        auto code = readInt64(doc, "keyCode");
        auto actionName = readString(doc, "action");
        std::optional<PressAction> action = actionName ? pressActionFromString(*actionName) : std::nullopt;
        if (!code || *code < 0 || *code > std::numeric_limits<uint16_t>::max() || !action) {
            protocolError(type, "missing or invalid 'keyCode'/'action'");
            return std::nullopt;
        }
        Key key;
        key.keyCode = static_cast<uint16_t>(*code);
        key.action = *action;
        auto mods = doc.FindMember("modifiers");
        if (mods != doc.MemberEnd() && mods->value.IsObject()) {
            key.modifiers.shift = readBool(mods->value, "shift").value_or(false);
            key.modifiers.control = readBool(mods->value, "control").value_or(false);
            key.modifiers.alt = readBool(mods->value, "alt").value_or(false);
            key.modifiers.meta = readBool(mods->value, "meta").value_or(false);
        }
        key.timestamp = readInt64(doc, "timestamp").value_or(0);
        return WireMessage{key};
    }
    if (type == "screen_info") {
        auto screens = doc.FindMember("screens");
        if (screens == doc.MemberEnd() || !screens->value.IsArray()) {
            protocolError(type, "missing 'screens'");
            return std::nullopt;
        }
        ScreenInfo info;
        for (const auto& entry : screens->value.GetArray()) {
            if (!entry.IsObject()) {
                protocolError(type, "screen entry is not an object");
                return std::nullopt;
            }
            auto width = readInt32(entry, "width");
            auto height = readInt32(entry, "height");
            if (!width || !height || *width < 0 || *height < 0) {
                protocolError(type, "screen entry without valid 'width'/'height'");
                return std::nullopt;
            }
            Core::ScreenRect rect;
            rect.width = *width;
            rect.height = *height;
            rect.x = readInt32(entry, "x").value_or(0);
            rect.y = readInt32(entry, "y").value_or(0);
            rect.isPrimary = readBool(entry, "isPrimary").value_or(false);
            if (!Core::isPlausibleRect(rect)) {
                protocolError(type, "screen entry outside the coordinate range");
                return std::nullopt;
            }
            info.screens.push_back(rect);
        }
        return WireMessage{info};
    }
    if (type == "error") {
        return WireMessage{ErrorMessage{readString(doc, "message").value_or("")}};
    }
    return WireMessage{Unknown{type}};
}

}

std::string encode(const WireMessage& message) {
    rj::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();

    std::visit([&w](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Hello>) {
            writeType(w, "hello");
            writeString(w, "version", m.version);
            writeString(w, "name", m.name);
        } else if constexpr (std::is_same_v<T, Connected>) {
            writeType(w, "connected");
        } else if constexpr (std::is_same_v<T, Ping>) {
            writeType(w, "ping");
        } else if constexpr (std::is_same_v<T, Pong>) {
            writeType(w, "pong");
        } else if constexpr (std::is_same_v<T, ModeSwitch>) {
            writeType(w, "mode_switch");
            w.Key("active"); w.Bool(m.active);
            if (m.ack) {
                w.Key("ack"); w.Bool(true);
            }
            if (m.x && m.y) {
                w.Key("x"); w.Int(*m.x);
                w.Key("y"); w.Int(*m.y);
            }
        } else if constexpr (std::is_same_v<T, MouseMove>) {
            writeType(w, "mouse_move");
            w.Key("x"); w.Int(m.x);
            w.Key("y"); w.Int(m.y);
            w.Key("timestamp"); w.Int64(m.timestamp);
        } else if constexpr (std::is_same_v<T, MouseButton>) {
            writeType(w, "mouse_button");
            writeString(w, "button", mouseButtonToString(m.button));
            writeString(w, "action", pressActionToString(m.action));
            w.Key("x"); w.Int(m.x);
            w.Key("y"); w.Int(m.y);
            w.Key("timestamp"); w.Int64(m.timestamp);
        } else if constexpr (std::is_same_v<T, MouseScroll>) {
            writeType(w, "mouse_scroll");
            w.Key("deltaX"); w.Int(m.deltaX);
            w.Key("deltaY"); w.Int(m.deltaY);
            w.Key("timestamp"); w.Int64(m.timestamp);
        } else if constexpr (std::is_same_v<T, Key>) {
            writeType(w, "key");
            w.Key("keyCode"); w.Uint(m.keyCode);
            writeString(w, "action", pressActionToString(m.action));
            w.Key("modifiers");
            w.StartObject();
            w.Key("shift"); w.Bool(m.modifiers.shift);
            w.Key("control"); w.Bool(m.modifiers.control);
            w.Key("alt"); w.Bool(m.modifiers.alt);
            w.Key("meta"); w.Bool(m.modifiers.meta);
            w.EndObject();
            w.Key("timestamp"); w.Int64(m.timestamp);
        } else if constexpr (std::is_same_v<T, ScreenInfo>) {
            writeType(w, "screen_info");
            w.Key("screens");
            w.StartArray();
            for (const auto& rect : m.screens) {
                w.StartObject();
                w.Key("width"); w.Int(rect.width);
                w.Key("height"); w.Int(rect.height);
                w.Key("x"); w.Int(rect.x);
                w.Key("y"); w.Int(rect.y);
                w.Key("isPrimary"); w.Bool(rect.isPrimary);
                w.EndObject();
            }
            w.EndArray();
        } else if constexpr (std::is_same_v<T, ErrorMessage>) {
            writeType(w, "error");
            writeString(w, "message", m.message);
        } else if constexpr (std::is_same_v<T, Unknown>) {
            writeString(w, "type", m.type);
        } else {
            static_assert(always_false_v<T>, "unhandled wire message");
        }
    }, message);

    w.EndObject();
    std::string line(buffer.GetString(), buffer.GetSize());
    line.push_back('\n');
    return line;
}

std::optional<WireMessage> decodeLine(const std::string& rawLine) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    if (line.empty()) {
        return std::nullopt;
    }

    try {
        rj::Document doc;
        // Iterative so nesting depth costs heap, not io thread stack.
        doc.Parse<rj::kParseIterativeFlag>(line.c_str());
        if (doc.HasParseError() || !doc.IsObject()) {
            Utils::Logger::GetInstance().Warning("Protocol: dropping malformed line (" + std::to_string(line.size()) + " bytes)");
            return std::nullopt;
        }
        auto type = readString(doc, "type");
        if (!type) {
            Utils::Logger::GetInstance().Warning("Protocol: dropping line without 'type'");
            return std::nullopt;
        }
        return decodeObject(doc, *type);
    } catch (const cereal::RapidJSONException& e) {
        Utils::Logger::GetInstance().Error(std::string("Protocol: JSON backend rejected line: ") + e.what());
        return std::nullopt;
    }
}

std::string messageTypeName(const WireMessage& message) {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Hello>) return "hello";
        else if constexpr (std::is_same_v<T, Connected>) return "connected";
        else if constexpr (std::is_same_v<T, Ping>) return "ping";
        else if constexpr (std::is_same_v<T, Pong>) return "pong";
        else if constexpr (std::is_same_v<T, ModeSwitch>) return "mode_switch";
        else if constexpr (std::is_same_v<T, MouseMove>) return "mouse_move";
        else if constexpr (std::is_same_v<T, MouseButton>) return "mouse_button";
        else if constexpr (std::is_same_v<T, MouseScroll>) return "mouse_scroll";
        else if constexpr (std::is_same_v<T, Key>) return "key";
        else if constexpr (std::is_same_v<T, ScreenInfo>) return "screen_info";
        else if constexpr (std::is_same_v<T, ErrorMessage>) return "error";
        else return "unknown(" + m.type + ")";
    }, message);
}

std::string mouseButtonToString(MouseButtonId button) {
    switch (button) {
        case MouseButtonId::Left: return "left";
        case MouseButtonId::Right: return "right";
        case MouseButtonId::Middle: return "middle";
        case MouseButtonId::Back: return "back";
        case MouseButtonId::Forward: return "forward";
    }
    return "left";
}

std::optional<MouseButtonId> mouseButtonFromString(const std::string& name) {
    if (name == "left") return MouseButtonId::Left;
    if (name == "right") return MouseButtonId::Right;
    if (name == "middle") return MouseButtonId::Middle;
    if (name == "back") return MouseButtonId::Back;
    if (name == "forward") return MouseButtonId::Forward;
    return std::nullopt;
}

std::string pressActionToString(PressAction action) {
    return action == PressAction::Down ? "down" : "up";
}

std::optional<PressAction> pressActionFromString(const std::string& name) {
    if (name == "down") return PressAction::Down;
    if (name == "up") return PressAction::Up;
    return std::nullopt;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void MessageDecoder::feed(const char* data, size_t length) {
    size_t offset = 0;
    while (offset < length) {
        if (discarding_) {
            const char* newline = static_cast<const char*>(std::memchr(data + offset, '\n', length - offset));
            if (!newline) {
                return;
            }
            offset = static_cast<size_t>(newline - data) + 1;
            discarding_ = false;
            continue;
        }

        buffer_.append(data + offset, length - offset);
        offset = length;

        // A partial line that already exceeds the limit can never become valid.
        size_t lastNewline = buffer_.rfind('\n');
        size_t tailStart = lastNewline == std::string::npos ? 0 : lastNewline + 1;
        if (buffer_.size() - tailStart > MAX_LINE_LENGTH) {
            Utils::Logger::GetInstance().Warning("Protocol: line exceeds " + std::to_string(MAX_LINE_LENGTH) +
                                                 " bytes, discarding until next newline");
            buffer_.erase(tailStart);
            droppedLines_++;
            discarding_ = true;
        }
    }
}

std::optional<std::string> MessageDecoder::nextLine() {
    size_t newline = buffer_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::vector<WireMessage> MessageDecoder::drain() {
    std::vector<WireMessage> messages;
    while (auto line = nextLine()) {
        if (line->empty()) {
            continue;
        }
        if (line->size() > MAX_LINE_LENGTH) {
            Utils::Logger::GetInstance().Warning("Protocol: dropping oversized line");
            droppedLines_++;
            continue;
        }
        auto decoded = decodeLine(*line);
        if (decoded) {
            messages.push_back(std::move(*decoded));
        } else {
            droppedLines_++;
        }
    }
    return messages;
}

void MessageDecoder::reset() {
    buffer_.clear();
    discarding_ = false;
    droppedLines_ = 0;
}

}
