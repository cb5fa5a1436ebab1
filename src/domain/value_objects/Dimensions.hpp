#pragma once

#include <boost/rational.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace pqe::domain {

using Exponent = boost::rational<int>;

// Exponents over the seven SI base dimensions, in the order
// mass, length, time, current, luminous intensity, temperature, amount.
class Dimensions {
public:
    static constexpr std::size_t kArity = 7;
    using Components = std::array<Exponent, kArity>;

    Dimensions();
    Dimensions(int mass, int length, int time, int current,
               int luminous_intensity, int temperature, int amount);
    explicit Dimensions(Components components);

    static Dimensions zero();
    // Unit vector along base dimension `index`.
    static Dimensions basis(std::size_t index);

    const Components& components() const noexcept { return components_; }
    const Exponent& operator[](std::size_t index) const { return components_.at(index); }

    Dimensions add(const Dimensions& other) const;
    Dimensions subtract(const Dimensions& other) const;
    Dimensions multiply(const Exponent& scalar) const;

    bool is_zero() const noexcept;
    std::size_t nonzero_count() const noexcept;

    // Index of the only non-zero component, if there is exactly one.
    std::optional<std::size_t> single_component() const noexcept;

    // k such that *this == k * other, for a non-zero integer k.
    std::optional<int> integer_multiple_of(const Dimensions& other) const;

    std::string to_string() const;

    bool operator==(const Dimensions& other) const { return components_ == other.components_; }
    bool operator!=(const Dimensions& other) const { return !(*this == other); }
    bool operator<(const Dimensions& other) const { return components_ < other.components_; }

private:
    Components components_;
};

std::string exponent_to_string(const Exponent& exponent);

} // namespace pqe::domain
