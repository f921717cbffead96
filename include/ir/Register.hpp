// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Register.hpp
 * @brief Bit and register definitions for quantum and classical wires
 *
 * A Register is a named, fixed-size array of bits of one kind. A Bit is
 * addressed either through its owning register (name + index) or, for bits
 * that belong to no register, as an anonymous physical index.
 *
 * @see Circuit.hpp for register ownership
 */

#pragma once

#include "Types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace qexport::ir {

/**
 * @brief Kind of wire a bit or register carries.
 */
enum class BitKind {
    Quantum,    ///< Qubit
    Classical   ///< Classical bit
};

/**
 * @brief Returns the name of a bit kind as a string.
 */
[[nodiscard]] constexpr std::string_view bitKindName(BitKind kind) noexcept {
    switch (kind) {
        case BitKind::Quantum:   return "qubit";
        case BitKind::Classical: return "bit";
    }
    return "unknown";
}

/**
 * @brief A single qubit or classical bit.
 *
 * Bits are value types. Two bits are equal when they have the same kind,
 * owning register and index.
 */
class Bit {
public:
    /**
     * @brief Constructs an anonymous physical bit.
     * @param kind Quantum or classical
     * @param index Physical index
     */
    Bit(BitKind kind, BitIndex index)
        : kind_(kind)
        , index_(index)
    {}

    /**
     * @brief Constructs a bit owned by a register.
     * @param kind Quantum or classical
     * @param register_name Name of the owning register
     * @param index Index within the register
     */
    Bit(BitKind kind, std::string register_name, BitIndex index)
        : kind_(kind)
        , register_(std::move(register_name))
        , index_(index)
    {}

    /// @brief Creates an anonymous physical qubit.
    [[nodiscard]] static Bit physicalQubit(BitIndex index) {
        return Bit(BitKind::Quantum, index);
    }

    /// @brief Creates an anonymous classical bit.
    [[nodiscard]] static Bit physicalClbit(BitIndex index) {
        return Bit(BitKind::Classical, index);
    }

    [[nodiscard]] BitKind kind() const noexcept { return kind_; }
    [[nodiscard]] BitIndex index() const noexcept { return index_; }

    /// @brief Returns the owning register name, if any.
    [[nodiscard]] const std::optional<std::string>& registerName() const noexcept {
        return register_;
    }

    /// @brief Returns true if this bit belongs to no register.
    [[nodiscard]] bool isAnonymous() const noexcept {
        return !register_.has_value();
    }

    [[nodiscard]] bool operator==(const Bit& other) const noexcept {
        return kind_ == other.kind_ &&
               register_ == other.register_ &&
               index_ == other.index_;
    }

    [[nodiscard]] bool operator!=(const Bit& other) const noexcept {
        return !(*this == other);
    }

    /// @brief Returns a string representation such as "q[0]" or "$3".
    [[nodiscard]] std::string toString() const {
        if (register_.has_value()) {
            return *register_ + "[" + std::to_string(index_) + "]";
        }
        return "$" + std::to_string(index_);
    }

private:
    BitKind kind_;
    std::optional<std::string> register_;
    BitIndex index_;
};

/**
 * @brief A named array of bits of one kind.
 *
 * Example:
 * @code
 * Register q = Register::quantum("q", 2);
 * Register c = Register::classical("c", 2);
 * Bit q0 = q[0];
 * @endcode
 */
class Register {
public:
    /**
     * @brief Constructs a register.
     * @param kind Quantum or classical
     * @param name Register name
     * @param size Number of bits
     */
    Register(BitKind kind, std::string name, std::size_t size)
        : kind_(kind)
        , name_(std::move(name))
        , size_(size)
    {}

    /// @brief Creates a quantum register.
    [[nodiscard]] static Register quantum(std::string name, std::size_t size) {
        return Register(BitKind::Quantum, std::move(name), size);
    }

    /// @brief Creates a classical register.
    [[nodiscard]] static Register classical(std::string name, std::size_t size) {
        return Register(BitKind::Classical, std::move(name), size);
    }

    [[nodiscard]] BitKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /**
     * @brief Returns the bit at the given index.
     * @throws std::out_of_range if index >= size()
     */
    [[nodiscard]] Bit operator[](BitIndex index) const {
        if (index >= size_) {
            throw std::out_of_range(
                "Bit index " + std::to_string(index) + " out of range for " +
                std::string(bitKindName(kind_)) + " register '" + name_ +
                "' of size " + std::to_string(size_));
        }
        return Bit(kind_, name_, index);
    }

    /// @brief Returns true if the bit is one of this register's bits.
    [[nodiscard]] bool contains(const Bit& bit) const noexcept {
        return bit.kind() == kind_ &&
               bit.registerName() == name_ &&
               bit.index() < size_;
    }

    [[nodiscard]] bool operator==(const Register& other) const noexcept {
        return kind_ == other.kind_ && name_ == other.name_ && size_ == other.size_;
    }

    [[nodiscard]] bool operator!=(const Register& other) const noexcept {
        return !(*this == other);
    }

private:
    BitKind kind_;
    std::string name_;
    std::size_t size_;
};

}  // namespace qexport::ir
