#ifndef TACMESH_ERRORS_HPP
#define TACMESH_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tacmesh {

    /**
     * Hash-chain violation. Fatal to the affected chain segment and never
     * repaired automatically.
     */
    class IntegrityError : public std::runtime_error {
    public:
        IntegrityError(const std::string& what, int64_t offendingIndex = -1)
            : std::runtime_error(what), index(offendingIndex) {}

        int64_t offendingIndex() const { return index; }

    private:
        int64_t index;
    };

    /**
     * Two ledgers without a common ancestor. Needs an operator; there is no
     * safe automatic merge.
     */
    class DivergentLedgerError : public std::runtime_error {
    public:
        explicit DivergentLedgerError(const std::string& what) : std::runtime_error(what) {}
    };

} // namespace tacmesh

#endif // TACMESH_ERRORS_HPP
