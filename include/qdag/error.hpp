#pragma once

#include <cstdint>
#include <exception>
#include <sstream>
#include <string>

namespace qdag {

// ============================================================================
// Base qdag Exception
// ============================================================================

class QdagError : public std::exception {
  public:
    explicit QdagError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override { return message_.c_str(); }

    const std::string &message() const { return message_; }

  protected:
    std::string message_;
};

// ============================================================================
// Validation errors (malformed indices, wires, matrices)
// ============================================================================

class ValueError : public QdagError {
  public:
    explicit ValueError(const std::string &message)
        : QdagError("ValueError: " + message) {}

    static ValueError invalid_node_index(int64_t index) {
        return ValueError("invalid node index " + std::to_string(index) +
                          ", must be -1 or a non-negative integer");
    }

    static ValueError null_wire(const std::string &context) {
        return ValueError("null wire reference passed to " + context);
    }

    static ValueError not_unitary(const std::string &details) {
        return ValueError("matrix is not unitary: " + details);
    }

    static ValueError out_of_range(const std::string &what, double min,
                                   double max, double got) {
        std::ostringstream oss;
        oss << what << " must be in range [" << min << ", " << max
            << "] but got " << got;
        return ValueError(oss.str());
    }
};

// ============================================================================
// Operation shape errors
// ============================================================================

class TypeError : public QdagError {
  public:
    explicit TypeError(const std::string &message)
        : QdagError("TypeError: " + message) {}

    static TypeError not_an_operation(const std::string &got) {
        return TypeError("expected an operation but got " + got);
    }

    static TypeError param_count_mismatch(const std::string &name,
                                          size_t expected, size_t got) {
        return TypeError("'" + name + "' takes " + std::to_string(expected) +
                         " parameters but " + std::to_string(got) +
                         " were given");
    }
};

// ============================================================================
// Runtime/internal errors
// ============================================================================

class RuntimeError : public QdagError {
  public:
    explicit RuntimeError(const std::string &message)
        : QdagError("RuntimeError: " + message) {}

    static RuntimeError internal(const std::string &details) {
        return RuntimeError("internal error: " + details);
    }
};

} // namespace qdag
