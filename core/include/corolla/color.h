#pragma once

/**
 * @file color.h
 * @brief Color class with hex parsing and interpolation
 *
 * Provides a convenient Color type that implicitly converts to glm::vec4.
 *
 * @par Example
 * @code
 * Color base = Color::fromHex("#fdfcf7");
 * Color active = Color::fromHex(0x6D00A3);
 * Color blended = base.lerp(active, intensity);
 * @endcode
 */

#include <glm/glm.hpp>
#include <string>
#include <optional>
#include <cstdint>
#include <cctype>
#include <algorithm>

namespace corolla {

/**
 * @brief RGBA color in 0-1 range
 */
class Color {
public:
    float r, g, b, a;

    // =========================================================================
    // Constructors
    // =========================================================================

    /// @brief Default constructor (opaque white)
    constexpr Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}

    /// @brief Construct from RGBA values (0-1 range)
    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    /// @brief Construct from glm::vec4
    constexpr Color(const glm::vec4& v)
        : r(v.r), g(v.g), b(v.b), a(v.a) {}

    /// @brief Construct from glm::vec3 (alpha defaults to 1.0)
    constexpr Color(const glm::vec3& v)
        : r(v.r), g(v.g), b(v.b), a(1.0f) {}

    // =========================================================================
    // Conversion Operators
    // =========================================================================

    /// @brief Implicit conversion to glm::vec4
    constexpr operator glm::vec4() const {
        return glm::vec4(r, g, b, a);
    }

    /// @brief Explicit conversion to glm::vec3 (discards alpha)
    constexpr explicit operator glm::vec3() const {
        return glm::vec3(r, g, b);
    }

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Create color from hex integer (0xRRGGBB or 0xRRGGBBAA)
     * @param hex Hex value
     * @return Color
     */
    static constexpr Color fromHex(uint32_t hex) {
        if (hex > 0xFFFFFF) {
            // 0xRRGGBBAA format
            return Color(
                ((hex >> 24) & 0xFF) / 255.0f,
                ((hex >> 16) & 0xFF) / 255.0f,
                ((hex >> 8) & 0xFF) / 255.0f,
                (hex & 0xFF) / 255.0f
            );
        }
        return Color(
            ((hex >> 16) & 0xFF) / 255.0f,
            ((hex >> 8) & 0xFF) / 255.0f,
            (hex & 0xFF) / 255.0f,
            1.0f
        );
    }

    /**
     * @brief Parse a hex string ("#RRGGBB", "#RRGGBBAA", "RRGGBB", "RRGGBBAA")
     * @return Color, or std::nullopt if the string is not a valid hex color
     */
    static std::optional<Color> parseHex(const std::string& hex) {
        std::string s = hex;
        if (!s.empty() && s[0] == '#') {
            s = s.substr(1);
        }
        if (s.length() != 6 && s.length() != 8) {
            return std::nullopt;
        }

        uint32_t val = 0;
        for (char c : s) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            int digit = std::isdigit(static_cast<unsigned char>(c))
                ? c - '0'
                : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
            val = (val << 4) | static_cast<uint32_t>(digit);
        }

        if (s.length() == 8) {
            return Color(
                ((val >> 24) & 0xFF) / 255.0f,
                ((val >> 16) & 0xFF) / 255.0f,
                ((val >> 8) & 0xFF) / 255.0f,
                (val & 0xFF) / 255.0f
            );
        }
        return fromHex(val);
    }

    /**
     * @brief Create color from hex string
     * @return Color (returns magenta on parse error for visibility)
     */
    static Color fromHex(const std::string& hex) {
        return parseHex(hex).value_or(Color(1.0f, 0.0f, 1.0f, 1.0f));
    }

    // =========================================================================
    // Blending / Interpolation
    // =========================================================================

    /**
     * @brief Linear interpolation between two colors
     * @param other Target color
     * @param t Interpolation factor (0 = this, 1 = other)
     * @return Interpolated color, exactly this at t=0 and exactly other at t=1
     */
    Color lerp(const Color& other, float t) const {
        float s = 1.0f - t;
        return Color(
            r * s + other.r * t,
            g * s + other.g * t,
            b * s + other.b * t,
            a * s + other.a * t
        );
    }

    // =========================================================================
    // Formatting
    // =========================================================================

    /**
     * @brief Convert to hex integer (0xRRGGBB)
     * @return Hex value (alpha discarded)
     */
    uint32_t toHex() const {
        auto channel = [](float v) {
            return static_cast<uint32_t>(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
        };
        return (channel(r) << 16) | (channel(g) << 8) | channel(b);
    }

    /// @brief Format as "#rrggbb"
    std::string toHexString() const {
        static const char* digits = "0123456789abcdef";
        uint32_t hex = toHex();
        std::string out = "#";
        for (int shift = 20; shift >= 0; shift -= 4) {
            out += digits[(hex >> shift) & 0xF];
        }
        return out;
    }

    // =========================================================================
    // Comparison Operators
    // =========================================================================

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    // =========================================================================
    // Static Color Constants
    // =========================================================================

    static const Color Ivory;       ///< #fdfcf7, resting petal color
    static const Color DeepPurple;  ///< #6d00a3, fully lit petal color
};

inline constexpr Color Color::Ivory = Color::fromHex(0xFDFCF7u);
inline constexpr Color Color::DeepPurple = Color::fromHex(0x6D00A3u);

} // namespace corolla
