#pragma once

#include <stdexcept>
#include <string>

namespace td {

    /**
     * @brief Input does not satisfy the structure a component requires
     *
     * Raised for heterogeneous operator counts or positions inside a batch,
     * malformed marker placement and malformed term lists.
     */
    class PreconditionError : public std::runtime_error {
    public:
        explicit PreconditionError(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * @brief Tensor shapes disagree between encoder, reducer and decoder
     *
     * Always a programming or configuration bug; never coerced.
     */
    class ShapeContractError : public std::logic_error {
    public:
        explicit ShapeContractError(const std::string& msg) : std::logic_error(msg) {}
    };

    /**
     * @brief Requested composition policy has no implementation
     */
    class NotImplementedError : public std::logic_error {
    public:
        explicit NotImplementedError(const std::string& msg) : std::logic_error(msg) {}
    };

    class MissingFieldError : public std::out_of_range {
    public:
        explicit MissingFieldError(const std::string& msg) : std::out_of_range(msg) {}
    };

    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
    };

} // namespace td
