#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace qdag {
namespace dag {

// Position of a node in a graph. Detached nodes have no index; the raw form
// encodes detachment as -1.
class NodeHandle {
  public:
    static constexpr int64_t kDetached = -1;

    NodeHandle() = default;
    explicit NodeHandle(size_t index);

    // Throws ValueError for values below -1
    static NodeHandle from_raw(int64_t raw);

    std::optional<size_t> index() const { return index_; }
    bool is_attached() const { return index_.has_value(); }

    int64_t raw_index() const {
        return index_ ? static_cast<int64_t>(*index_) : kDetached;
    }
    void set_raw_index(int64_t raw);

    void attach(size_t index);
    void detach() { index_.reset(); }

    // Ordering is on the raw index only; detached sorts first
    bool operator==(const NodeHandle &other) const {
        return raw_index() == other.raw_index();
    }
    bool operator!=(const NodeHandle &other) const {
        return !(*this == other);
    }
    bool operator<(const NodeHandle &other) const {
        return raw_index() < other.raw_index();
    }
    bool operator>(const NodeHandle &other) const { return other < *this; }

    uint64_t hash() const;

  private:
    std::optional<size_t> index_;
};

} // namespace dag
} // namespace qdag
