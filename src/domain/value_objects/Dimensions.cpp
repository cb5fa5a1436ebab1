#include "domain/value_objects/Dimensions.hpp"

#include <sstream>
#include <stdexcept>

namespace pqe::domain {

Dimensions::Dimensions() : components_{} {}

Dimensions::Dimensions(int mass, int length, int time, int current,
                       int luminous_intensity, int temperature, int amount)
    : components_{Exponent(mass), Exponent(length), Exponent(time), Exponent(current),
                  Exponent(luminous_intensity), Exponent(temperature), Exponent(amount)} {}

Dimensions::Dimensions(Components components) : components_(components) {}

Dimensions Dimensions::zero() {
    return Dimensions();
}

Dimensions Dimensions::basis(std::size_t index) {
    if (index >= kArity) {
        throw std::out_of_range("Dimension index out of range: " + std::to_string(index));
    }
    Components components{};
    components[index] = Exponent(1);
    return Dimensions(components);
}

Dimensions Dimensions::add(const Dimensions& other) const {
    Components result;
    for (std::size_t i = 0; i < kArity; ++i) {
        result[i] = components_[i] + other.components_[i];
    }
    return Dimensions(result);
}

Dimensions Dimensions::subtract(const Dimensions& other) const {
    Components result;
    for (std::size_t i = 0; i < kArity; ++i) {
        result[i] = components_[i] - other.components_[i];
    }
    return Dimensions(result);
}

Dimensions Dimensions::multiply(const Exponent& scalar) const {
    Components result;
    for (std::size_t i = 0; i < kArity; ++i) {
        result[i] = components_[i] * scalar;
    }
    return Dimensions(result);
}

bool Dimensions::is_zero() const noexcept {
    return nonzero_count() == 0;
}

std::size_t Dimensions::nonzero_count() const noexcept {
    std::size_t count = 0;
    for (const auto& c : components_) {
        if (c.numerator() != 0) ++count;
    }
    return count;
}

std::optional<std::size_t> Dimensions::single_component() const noexcept {
    if (nonzero_count() != 1) return std::nullopt;
    for (std::size_t i = 0; i < kArity; ++i) {
        if (components_[i].numerator() != 0) return i;
    }
    return std::nullopt;
}

std::optional<int> Dimensions::integer_multiple_of(const Dimensions& other) const {
    if (is_zero() || other.is_zero()) return std::nullopt;

    // The ratio is fixed by the first component where `other` is non-zero;
    // every other component has to agree with it.
    std::optional<Exponent> ratio;
    for (std::size_t i = 0; i < kArity; ++i) {
        const auto& mine = components_[i];
        const auto& theirs = other.components_[i];
        if (theirs.numerator() == 0) {
            if (mine.numerator() != 0) return std::nullopt;
            continue;
        }
        Exponent r = mine / theirs;
        if (!ratio) {
            ratio = r;
        } else if (*ratio != r) {
            return std::nullopt;
        }
    }
    if (!ratio || ratio->denominator() != 1 || ratio->numerator() == 0) {
        return std::nullopt;
    }
    return ratio->numerator();
}

std::string Dimensions::to_string() const {
    std::ostringstream os;
    os << "Dimensions(";
    for (std::size_t i = 0; i < kArity; ++i) {
        if (i > 0) os << ", ";
        os << exponent_to_string(components_[i]);
    }
    os << ")";
    return os.str();
}

std::string exponent_to_string(const Exponent& exponent) {
    if (exponent.denominator() == 1) {
        return std::to_string(exponent.numerator());
    }
    return std::to_string(exponent.numerator()) + "/" + std::to_string(exponent.denominator());
}

} // namespace pqe::domain
