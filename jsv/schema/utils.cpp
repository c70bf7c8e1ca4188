/*
 * utils.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-13

Description: JSON value comparison and message helpers for keywords

**************************************************/

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <unordered_set>

#include <boost/multiprecision/cpp_int.hpp>

namespace jsv::schema::utils {

namespace {
using boost::multiprecision::cpp_int;

/// value == mantissa * 10^exponent
struct Decimal {
    cpp_int mantissa;
    long exponent{0};
};

auto parseDecimal(const std::string& text) -> Decimal {
    Decimal decimal;
    std::string digits;
    long exponent = 0;
    bool negative = false;
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    bool fraction = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            digits += c;
            if (fraction) {
                --exponent;
            }
        } else if (c == '.') {
            fraction = true;
        } else if (c == 'e' || c == 'E') {
            exponent += std::stol(text.substr(pos + 1));
            break;
        }
    }
    auto first = digits.find_first_not_of('0');
    decimal.mantissa =
        first == std::string::npos ? cpp_int(0) : cpp_int(digits.substr(first));
    if (negative) {
        decimal.mantissa = -decimal.mantissa;
    }
    decimal.exponent = exponent;
    return decimal;
}

auto toDecimal(const json& number) -> Decimal {
    return parseDecimal(number.dump());
}

auto pow10(long exponent) -> cpp_int {
    cpp_int result = 1;
    for (long i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

auto decimalMultipleOf(const json& value, const json& divisor) -> bool {
    Decimal v = toDecimal(value);
    Decimal d = toDecimal(divisor);
    if (d.mantissa == 0) {
        return false;
    }
    long base = std::min(v.exponent, d.exponent);
    cpp_int numerator = v.mantissa * pow10(v.exponent - base);
    cpp_int denominator = d.mantissa * pow10(d.exponent - base);
    return numerator % denominator == 0;
}

auto isPrimitive(const json& value) -> bool {
    return !value.is_array() && !value.is_object();
}

/// Canonical text for primitives so that equal() values collide.
auto fingerprint(const json& value) -> std::string {
    switch (value.type()) {
        case json::value_t::null:
            return "n";
        case json::value_t::boolean:
            return value.get<bool>() ? "b1" : "b0";
        case json::value_t::string:
            return "s" + value.get_ref<const std::string&>();
        case json::value_t::number_integer:
            return "i" + std::to_string(value.get<std::int64_t>());
        case json::value_t::number_unsigned:
            return "i" + std::to_string(value.get<std::uint64_t>());
        case json::value_t::number_float: {
            double number = value.get<double>();
            if (std::isfinite(number) && std::trunc(number) == number) {
                if (number >= -9223372036854775808.0 &&
                    number < 9223372036854775808.0) {
                    return "i" +
                           std::to_string(static_cast<std::int64_t>(number));
                }
                if (number > 0 && number < 18446744073709551616.0) {
                    return "i" +
                           std::to_string(static_cast<std::uint64_t>(number));
                }
            }
            return "f" + value.dump();
        }
        default:
            return "x" + value.dump();
    }
}
}  // namespace

auto compareNumbers(const json& lhs, const json& rhs) -> int {
    if (lhs.is_number_integer() && rhs.is_number_integer()) {
        const bool lhsUnsigned = lhs.is_number_unsigned();
        const bool rhsUnsigned = rhs.is_number_unsigned();
        if (lhsUnsigned == rhsUnsigned) {
            if (lhsUnsigned) {
                auto a = lhs.get<std::uint64_t>();
                auto b = rhs.get<std::uint64_t>();
                return a < b ? -1 : (a > b ? 1 : 0);
            }
            auto a = lhs.get<std::int64_t>();
            auto b = rhs.get<std::int64_t>();
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        if (lhsUnsigned) {
            return -compareNumbers(rhs, lhs);
        }
        auto a = lhs.get<std::int64_t>();
        if (a < 0) {
            return -1;
        }
        auto ua = static_cast<std::uint64_t>(a);
        auto b = rhs.get<std::uint64_t>();
        return ua < b ? -1 : (ua > b ? 1 : 0);
    }
    auto a = lhs.get<long double>();
    auto b = rhs.get<long double>();
    return a < b ? -1 : (a > b ? 1 : 0);
}

auto equal(const json& lhs, const json& rhs) -> bool {
    if (lhs.is_boolean() || rhs.is_boolean()) {
        return lhs.is_boolean() && rhs.is_boolean() &&
               lhs.get<bool>() == rhs.get<bool>();
    }
    if (lhs.is_number() && rhs.is_number()) {
        return compareNumbers(lhs, rhs) == 0;
    }
    if (lhs.type() != rhs.type()) {
        return false;
    }
    if (lhs.is_array()) {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (!equal(lhs[i], rhs[i])) {
                return false;
            }
        }
        return true;
    }
    if (lhs.is_object()) {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (auto it = lhs.begin(); it != lhs.end(); ++it) {
            auto other = rhs.find(it.key());
            if (other == rhs.end() || !equal(it.value(), *other)) {
                return false;
            }
        }
        return true;
    }
    return lhs == rhs;
}

auto uniq(const json& array) -> bool {
    bool primitive = true;
    for (const auto& item : array) {
        if (!isPrimitive(item)) {
            primitive = false;
            break;
        }
    }
    if (primitive) {
        std::unordered_set<std::string> seen;
        for (const auto& item : array) {
            if (!seen.insert(fingerprint(item)).second) {
                return false;
            }
        }
        return true;
    }
    for (std::size_t i = 0; i < array.size(); ++i) {
        for (std::size_t j = i + 1; j < array.size(); ++j) {
            if (equal(array[i], array[j])) {
                return false;
            }
        }
    }
    return true;
}

auto isIntegral(const json& number) -> bool {
    if (number.is_number_integer()) {
        return true;
    }
    if (!number.is_number_float()) {
        return false;
    }
    double value = number.get<double>();
    return std::isfinite(value) && std::trunc(value) == value;
}

auto isMultipleOf(const json& value, const json& divisor) -> bool {
    if (value.is_number_integer() && divisor.is_number_integer()) {
        cpp_int v = value.is_number_unsigned()
                        ? cpp_int(value.get<std::uint64_t>())
                        : cpp_int(value.get<std::int64_t>());
        cpp_int d = divisor.is_number_unsigned()
                        ? cpp_int(divisor.get<std::uint64_t>())
                        : cpp_int(divisor.get<std::int64_t>());
        return d != 0 && v % d == 0;
    }
    double d = divisor.get<double>();
    if (d == 0.0 || !std::isfinite(d)) {
        return false;
    }
    double quotient = value.get<double>() / d;
    if (std::isfinite(quotient)) {
        double nearest = std::round(quotient);
        double tolerance = 1e-9 * std::max(1.0, std::fabs(quotient));
        if (std::fabs(quotient - nearest) > tolerance) {
            return false;
        }
    }
    return decimalMultipleOf(value, divisor);
}

auto utf8Length(std::string_view text) -> std::size_t {
    std::size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

auto repr(const json& value) -> std::string {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto extrasMessage(const std::vector<json>& extras) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < extras.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += repr(extras[i]);
    }
    out += extras.size() == 1 ? " was" : " were";
    return out;
}

}  // namespace jsv::schema::utils
