#include "tpch/core/error.h"

namespace tpch {
namespace core {

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::CONNECTION: return "CONNECTION";
        case Error::Code::STATEMENT: return "STATEMENT";
        case Error::Code::USE_AFTER_CLOSE: return "USE_AFTER_CLOSE";
        case Error::Code::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace tpch
