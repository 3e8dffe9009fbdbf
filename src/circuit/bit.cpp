#include "qdag/circuit/bit.hpp"
#include "qdag/hash.hpp"

#include <atomic>
#include <limits>
#include <sstream>

namespace qdag {

namespace {

std::atomic<uint64_t> &bit_id_counter() {
    static std::atomic<uint64_t> counter{0};
    return counter;
}

uint64_t next_bit_id() { return bit_id_counter().fetch_add(1); }

// Fresh ids must never reuse one that was restored from elsewhere
void reserve_bit_id(uint64_t id) {
    if (id == std::numeric_limits<uint64_t>::max())
        return;
    auto &counter = bit_id_counter();
    uint64_t current = counter.load();
    while (current <= id && !counter.compare_exchange_weak(current, id + 1)) {
    }
}

} // namespace

std::string bit_kind_name(BitKind kind) {
    return kind == BitKind::Qubit ? "qubit" : "clbit";
}

Bit::Bit(BitKind kind) : kind_(kind), id_(next_bit_id()) {}

Bit::Bit(BitKind kind, uint64_t id) : kind_(kind), id_(id) {}

Bit::Bit(BitKind kind, std::string register_name, uint32_t position)
    : kind_(kind), register_name_(std::move(register_name)),
      position_(position) {}

Bit Bit::anonymous(BitKind kind, uint64_t id) {
    reserve_bit_id(id);
    return Bit(kind, id);
}

bool Bit::operator==(const Bit &other) const {
    if (kind_ != other.kind_ || register_name_ != other.register_name_) {
        return false;
    }
    if (register_name_) {
        return position_ == other.position_;
    }
    return id_ == other.id_;
}

uint64_t Bit::hash() const {
    uint64_t h = fnv_hash_byte(FNV_OFFSET, static_cast<uint8_t>(kind_));
    if (register_name_) {
        h = fnv_hash_string(h, *register_name_);
        h = fnv_hash_u64(h, position_);
    } else {
        h = fnv_hash_u64(h, id_);
    }
    return h;
}

std::string Bit::repr() const {
    std::ostringstream oss;
    oss << (kind_ == BitKind::Qubit ? "Qubit(" : "Clbit(");
    if (register_name_) {
        oss << "'" << *register_name_ << "', " << position_;
    } else {
        oss << "#" << id_;
    }
    oss << ")";
    return oss.str();
}

WireRef make_qubit() { return std::make_shared<const Bit>(BitKind::Qubit); }

WireRef make_clbit() { return std::make_shared<const Bit>(BitKind::Clbit); }

WireRef make_qubit(const std::string &register_name, uint32_t position) {
    return std::make_shared<const Bit>(BitKind::Qubit, register_name,
                                       position);
}

WireRef make_clbit(const std::string &register_name, uint32_t position) {
    return std::make_shared<const Bit>(BitKind::Clbit, register_name,
                                       position);
}

WireList make_register(BitKind kind, const std::string &name, uint32_t size) {
    WireList wires;
    wires.reserve(size);
    for (uint32_t i = 0; i < size; ++i) {
        wires.push_back(std::make_shared<const Bit>(kind, name, i));
    }
    return wires;
}

bool wire_eq(const WireRef &a, const WireRef &b) {
    if (a == b)
        return true;
    if (!a || !b)
        return false;
    return *a == *b;
}

uint64_t wire_hash(const WireRef &wire) {
    return wire ? wire->hash() : FNV_OFFSET;
}

bool wires_eq(const WireList &a, const WireList &b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!wire_eq(a[i], b[i]))
            return false;
    }
    return true;
}

std::string wire_repr(const WireRef &wire) {
    return wire ? wire->repr() : "None";
}

std::string wires_repr(const WireList &wires) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < wires.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << wire_repr(wires[i]);
    }
    if (wires.size() == 1)
        oss << ",";
    oss << ")";
    return oss.str();
}

std::ostream &operator<<(std::ostream &os, const Bit &bit) {
    return os << bit.repr();
}

} // namespace qdag
