#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace qdag {

enum class BitKind : uint8_t { Qubit, Clbit };

std::string bit_kind_name(BitKind kind);

// A quantum or classical wire. Bits owned by a register compare by
// (kind, register, position); anonymous bits compare by (kind, id).
class Bit {
  public:
    // Anonymous bit with a fresh process-unique id
    explicit Bit(BitKind kind);

    Bit(BitKind kind, std::string register_name, uint32_t position);

    // Rebuilds an anonymous bit with a known id (snapshot restore). Bits
    // created afterwards get ids above it.
    static Bit anonymous(BitKind kind, uint64_t id);

    BitKind kind() const { return kind_; }
    bool is_qubit() const { return kind_ == BitKind::Qubit; }
    bool has_register() const { return register_name_.has_value(); }
    const std::optional<std::string> &register_name() const {
        return register_name_;
    }
    uint32_t position() const { return position_; }
    uint64_t id() const { return id_; }

    bool operator==(const Bit &other) const;
    bool operator!=(const Bit &other) const { return !(*this == other); }

    uint64_t hash() const;

    std::string repr() const;

  private:
    Bit(BitKind kind, uint64_t id);

    BitKind kind_;
    std::optional<std::string> register_name_;
    uint32_t position_ = 0;
    uint64_t id_ = 0;
};

// Wires are shared with the circuit's wire table; nodes never own them.
using WireRef = std::shared_ptr<const Bit>;
using WireList = std::vector<WireRef>;

WireRef make_qubit();
WireRef make_clbit();
WireRef make_qubit(const std::string &register_name, uint32_t position);
WireRef make_clbit(const std::string &register_name, uint32_t position);

// Builds a register of `size` bits named `name`
WireList make_register(BitKind kind, const std::string &name, uint32_t size);

// Equality and hash under the wire's own rules; null only equals null
bool wire_eq(const WireRef &a, const WireRef &b);
uint64_t wire_hash(const WireRef &wire);

// Element-wise wire equality
bool wires_eq(const WireList &a, const WireList &b);

std::string wire_repr(const WireRef &wire);
std::string wires_repr(const WireList &wires);

std::ostream &operator<<(std::ostream &os, const Bit &bit);

} // namespace qdag
