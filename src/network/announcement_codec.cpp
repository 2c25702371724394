/**
 * @file announcement_codec.cpp
 * @brief AnnouncementCodec built on jsoncpp.
 * @author Dimitris Kafetzis
 */

#include "network/announcement_codec.hpp"

#include <json/json.h>

#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace lan_discovery {

namespace {

Json::StreamWriterBuilder compact_writer() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return builder;
}

}  // anonymous namespace

bool is_valid_utf8(std::string_view text) noexcept {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }
        if (i + len > n) return false;

        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += len;
    }
    return true;
}

std::string AnnouncementCodec::encode(const Announcement& announcement) {
    Json::Value root(Json::objectValue);
    root["name"] = announcement.name;
    root["port"] = Json::UInt(announcement.port);
    return Json::writeString(compact_writer(), root);
}

Result<Announcement> AnnouncementCodec::decode(const char* data, size_t size) {
    if (data == nullptr || size == 0) {
        return Error{ErrorKind::Decode, "Empty payload"};
    }

    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(data, data + size, &root, &errors)) {
            return Error{ErrorKind::Decode, "Malformed JSON: " + errors};
        }
    } catch (const Json::Exception& e) {
        // Nesting past stackLimit throws instead of failing the parse
        return Error{ErrorKind::Decode, std::string("Malformed JSON: ") + e.what()};
    }

    if (!root.isObject()) {
        return Error{ErrorKind::Decode, "Announcement is not an object"};
    }

    const Json::Value& name = root["name"];
    const Json::Value& port = root["port"];

    if (!name.isString()) {
        return Error{ErrorKind::Decode, "Missing or non-string 'name'"};
    }
    std::string text = name.asString();
    if (!is_valid_utf8(text)) {
        return Error{ErrorKind::Decode, "'name' is not valid UTF-8"};
    }
    // isUInt() alone also admits integral doubles such as 8080.0
    bool integer_type = port.type() == Json::intValue || port.type() == Json::uintValue;
    if (!integer_type || !port.isUInt() || port.asUInt() > std::numeric_limits<uint16_t>::max()) {
        return Error{ErrorKind::Decode, "Missing or out-of-range 'port'"};
    }

    return Announcement{
        .name = std::move(text),
        .port = static_cast<uint16_t>(port.asUInt())
    };
}

Result<Announcement> AnnouncementCodec::decode(const std::string& payload) {
    return decode(payload.data(), payload.size());
}

std::vector<uint8_t> AnnouncementCodec::encode_peers(const std::vector<Peer>& peers) {
    try {
        Json::Value root(Json::arrayValue);
        for (const auto& peer : peers) {
            Json::Value entry(Json::objectValue);
            entry["addr"] = peer.addr_string();
            entry["name"] = peer.name;
            entry["port"] = Json::UInt(peer.port);
            root.append(entry);
        }

        auto text = Json::writeString(compact_writer(), root);
        return std::vector<uint8_t>(text.begin(), text.end());

    } catch (const std::exception&) {
        return {};
    }
}

}  // namespace lan_discovery
