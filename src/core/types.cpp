#include "core/types.hpp"

#include "core/errors.hpp"

namespace kbengine {

const char* to_string(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending:
            return "PENDING";
        case DocumentStatus::Processing:
            return "PROCESSING";
        case DocumentStatus::Completed:
            return "COMPLETED";
        case DocumentStatus::Failed:
            return "FAILED";
    }
    return "UNKNOWN";
}

DocumentStatus parse_document_status(std::string_view value) {
    if (value == "PENDING") {
        return DocumentStatus::Pending;
    }
    if (value == "PROCESSING") {
        return DocumentStatus::Processing;
    }
    if (value == "COMPLETED") {
        return DocumentStatus::Completed;
    }
    if (value == "FAILED") {
        return DocumentStatus::Failed;
    }
    throw InvalidOptionError("unknown document status: " + std::string{value});
}

}  // namespace kbengine
