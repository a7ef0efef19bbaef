#pragma once
#include <stdexcept>
#include <string>

namespace urysohn
{

    /**
     * Base class for contract failures raised by the construction
     *
     * Programming errors (bad tolerance, negative depth, null oracle)
     * are reported with std::invalid_argument instead.
     */
    class UrysohnError : public std::runtime_error
    {
    public:
        explicit UrysohnError(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * Root node requested with C not contained in U
     * (equivalently: the two closed sets handed to between() intersect)
     */
    class PreconditionViolated : public UrysohnError
    {
    public:
        explicit PreconditionViolated(const std::string &what) : UrysohnError(what) {}
    };

    /**
     * Oracle returned V with C ⊄ V or closure(V) ⊄ U
     */
    class OracleContractViolated : public UrysohnError
    {
    public:
        explicit OracleContractViolated(const std::string &what) : UrysohnError(what) {}
    };

} // namespace urysohn
