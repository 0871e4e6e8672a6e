#include "sealdrop/password.hpp"

#include "sealdrop/crypto.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace sealdrop::password {

namespace {

constexpr std::string_view kCharset =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789!@#$%^&*";

constexpr std::array<std::string_view, 5> kCommonFragments = {
    "password", "123456", "qwerty", "admin", "letmein"
};

bool IsAsciiLower(unsigned char ch) { return ch >= 'a' && ch <= 'z'; }
bool IsAsciiUpper(unsigned char ch) { return ch >= 'A' && ch <= 'Z'; }
bool IsAsciiDigit(unsigned char ch) { return ch >= '0' && ch <= '9'; }
bool IsAsciiLetter(unsigned char ch) { return IsAsciiLower(ch) || IsAsciiUpper(ch); }

// UTF-8 aware: continuation bytes do not count.
std::size_t CharacterCount(const std::string& text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
        return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
    }));
}

bool HasTripleRun(const std::string& text) {
    for (std::size_t i = 2; i < text.size(); ++i) {
        if (text[i] == text[i - 1] && text[i] == text[i - 2]) {
            return true;
        }
    }
    return false;
}

std::string ToLower(const std::string& text) {
    std::string out = text;
    for (char& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

}  // namespace

int EstimateStrength(const std::string& password) {
    int score = static_cast<int>(std::min<std::size_t>(CharacterCount(password) * 2, 30));

    bool lower = false;
    bool upper = false;
    bool digit = false;
    bool other = false;
    for (char raw : password) {
        unsigned char ch = static_cast<unsigned char>(raw);
        if (IsAsciiLower(ch)) {
            lower = true;
        } else if (IsAsciiUpper(ch)) {
            upper = true;
        } else if (IsAsciiDigit(ch)) {
            digit = true;
        } else {
            other = true;
        }
    }
    score += lower ? 10 : 0;
    score += upper ? 10 : 0;
    score += digit ? 10 : 0;
    score += other ? 20 : 0;

    if (HasTripleRun(password)) {
        score -= 10;
    }
    if (!password.empty()) {
        if (std::all_of(password.begin(), password.end(),
                        [](char ch) { return IsAsciiLetter(static_cast<unsigned char>(ch)); })) {
            score -= 10;
        }
        if (std::all_of(password.begin(), password.end(),
                        [](char ch) { return IsAsciiDigit(static_cast<unsigned char>(ch)); })) {
            score -= 10;
        }
    }

    const std::string lowered = ToLower(password);
    for (std::string_view fragment : kCommonFragments) {
        if (lowered.find(fragment) != std::string::npos) {
            score -= 30;
            break;
        }
    }
    return std::clamp(score, 0, 100);
}

const char* StrengthLabel(int score) {
    if (score < 30) {
        return "Weak";
    }
    if (score < 60) {
        return "Fair";
    }
    if (score < 80) {
        return "Good";
    }
    return "Strong";
}

bool MeetsThreshold(const std::string& password, int threshold) {
    return EstimateStrength(password) >= threshold;
}

std::string GenerateSecurePassword(std::size_t length) {
    if (length == 0) {
        throw std::invalid_argument("Password length must be positive");
    }
    // Largest multiple of the charset size that fits in a byte.
    const unsigned limit = 256u - (256u % static_cast<unsigned>(kCharset.size()));
    std::string out;
    out.reserve(length);
    while (out.size() < length) {
        crypto::Bytes pool = crypto::RandomBytes(length * 2);
        for (std::uint8_t byte : pool) {
            if (byte >= limit) {
                continue;
            }
            out.push_back(kCharset[byte % kCharset.size()]);
            if (out.size() == length) {
                break;
            }
        }
        crypto::Cleanse(pool);
    }
    return out;
}

}  // namespace sealdrop::password
