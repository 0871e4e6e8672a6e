#include "sealdrop/metadata.hpp"

#include <chrono>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace sealdrop::metadata {

namespace {

constexpr std::string_view kKeyVersion = "version";
constexpr std::string_view kKeyAlgorithm = "algorithm";
constexpr std::string_view kKeyIterations = "iterations";
constexpr std::string_view kKeyOriginalSize = "originalSize";
constexpr std::string_view kKeyOriginalName = "originalName";
constexpr std::string_view kKeyTimestamp = "timestamp";

struct JsonValue {
    bool is_string = false;
    std::string text;
};

std::string EscapeJson(std::string_view input) {
    std::string out;
    out.reserve(input.size() + 2);
    for (char ch : input) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buffer;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

class FlatObjectParser {
public:
    explicit FlatObjectParser(std::string_view json) : json_(json) {}

    std::unordered_map<std::string, JsonValue> Parse() {
        std::unordered_map<std::string, JsonValue> fields;
        SkipSpace();
        Expect('{');
        SkipSpace();
        if (Peek() == '}') {
            ++pos_;
        } else {
            while (true) {
                SkipSpace();
                std::string key = ParseString();
                SkipSpace();
                Expect(':');
                SkipSpace();
                fields[key] = ParseValue();
                SkipSpace();
                if (Peek() == ',') {
                    ++pos_;
                    continue;
                }
                Expect('}');
                break;
            }
        }
        SkipSpace();
        if (pos_ != json_.size()) {
            throw std::runtime_error("Trailing data after metadata object");
        }
        return fields;
    }

private:
    char Peek() const {
        if (pos_ >= json_.size()) {
            throw std::runtime_error("Unexpected end of metadata");
        }
        return json_[pos_];
    }

    void Expect(char ch) {
        if (Peek() != ch) {
            throw std::runtime_error("Unexpected character in metadata");
        }
        ++pos_;
    }

    void SkipSpace() {
        while (pos_ < json_.size()
               && (json_[pos_] == ' ' || json_[pos_] == '\n' || json_[pos_] == '\r' || json_[pos_] == '\t')) {
            ++pos_;
        }
    }

    std::uint32_t ParseHex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Truncated unicode escape in metadata");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char ch = json_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                throw std::runtime_error("Bad unicode escape in metadata");
            }
        }
        return value;
    }

    std::string ParseString() {
        Expect('"');
        std::string out;
        while (true) {
            char ch = Peek();
            ++pos_;
            if (ch == '"') {
                return out;
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            char esc = Peek();
            ++pos_;
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    std::uint32_t cp = ParseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < json_.size() && json_[pos_] == '\\'
                        && json_[pos_ + 1] == 'u') {
                        pos_ += 2;
                        std::uint32_t low = ParseHex4();
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    AppendUtf8(out, cp);
                    break;
                }
                default:
                    throw std::runtime_error("Bad escape in metadata");
            }
        }
    }

    JsonValue ParseValue() {
        JsonValue value;
        if (Peek() == '"') {
            value.is_string = true;
            value.text = ParseString();
            return value;
        }
        std::size_t start = pos_;
        while (pos_ < json_.size() && json_[pos_] != ',' && json_[pos_] != '}' && json_[pos_] != ' '
               && json_[pos_] != '\n' && json_[pos_] != '\r' && json_[pos_] != '\t') {
            ++pos_;
        }
        if (start == pos_) {
            throw std::runtime_error("Empty value in metadata");
        }
        value.text = std::string(json_.substr(start, pos_ - start));
        return value;
    }

    std::string_view json_;
    std::size_t pos_ = 0;
};

const JsonValue& Require(const std::unordered_map<std::string, JsonValue>& fields, std::string_view key) {
    auto it = fields.find(std::string(key));
    if (it == fields.end()) {
        throw std::runtime_error("Metadata is missing " + std::string(key));
    }
    return it->second;
}

std::int64_t ToInteger(const JsonValue& value, std::int64_t min, std::int64_t max) {
    if (value.is_string || value.text.empty()) {
        throw std::runtime_error("Metadata number expected");
    }
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value.text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Metadata number out of range");
    }
    if (consumed != value.text.size() || parsed < min || parsed > max) {
        throw std::runtime_error("Metadata number out of range");
    }
    return static_cast<std::int64_t>(parsed);
}

}  // namespace

std::string ToJson(const EnvelopeMetadata& meta) {
    std::string json;
    json.reserve(160 + meta.original_name_encrypted.size());
    json.push_back('{');
    json += "\"" + std::string(kKeyVersion) + "\":" + std::to_string(meta.version);
    json += ",\"" + std::string(kKeyAlgorithm) + "\":\"" + EscapeJson(meta.algorithm) + "\"";
    json += ",\"" + std::string(kKeyIterations) + "\":" + std::to_string(meta.kdf_iterations);
    json += ",\"" + std::string(kKeyOriginalSize) + "\":" + std::to_string(meta.original_size);
    json += ",\"" + std::string(kKeyOriginalName) + "\":\"" + EscapeJson(meta.original_name_encrypted) + "\"";
    json += ",\"" + std::string(kKeyTimestamp) + "\":" + std::to_string(meta.timestamp_ms);
    json.push_back('}');
    return json;
}

EnvelopeMetadata FromJson(std::string_view json) {
    auto fields = FlatObjectParser(json).Parse();
    constexpr std::int64_t kU32Max = std::numeric_limits<std::uint32_t>::max();
    constexpr std::int64_t kI64Max = std::numeric_limits<std::int64_t>::max();

    EnvelopeMetadata meta;
    meta.version = static_cast<std::uint32_t>(ToInteger(Require(fields, kKeyVersion), 0, kU32Max));
    const JsonValue& algorithm = Require(fields, kKeyAlgorithm);
    if (!algorithm.is_string) {
        throw std::runtime_error("Metadata algorithm must be a string");
    }
    meta.algorithm = algorithm.text;
    auto iterations = fields.find(std::string(kKeyIterations));
    if (iterations != fields.end()) {
        meta.kdf_iterations = static_cast<std::uint32_t>(ToInteger(iterations->second, 0, kU32Max));
    }
    meta.original_size = static_cast<std::uint64_t>(ToInteger(Require(fields, kKeyOriginalSize), 0, kI64Max));
    const JsonValue& name = Require(fields, kKeyOriginalName);
    if (!name.is_string) {
        throw std::runtime_error("Metadata originalName must be a string");
    }
    meta.original_name_encrypted = name.text;
    auto timestamp = fields.find(std::string(kKeyTimestamp));
    if (timestamp != fields.end()) {
        meta.timestamp_ms = ToInteger(timestamp->second, 0, kI64Max);
    }
    return meta;
}

std::int64_t NowMillis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

}  // namespace sealdrop::metadata
