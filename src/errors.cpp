#include "errors.h"

namespace viva {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:             return "None";
        case ErrorType::InvalidPlan:      return "InvalidPlan";
        case ErrorType::SpeechTimeout:    return "SpeechTimeout";
        case ErrorType::ScoringFailure:   return "ScoringFailure";
        case ErrorType::BudgetExhausted:  return "BudgetExhausted";
        case ErrorType::DeadlineExceeded: return "DeadlineExceeded";
        case ErrorType::Aborted:          return "Aborted";
        case ErrorType::Cancelled:        return "Cancelled";
        case ErrorType::IOError:          return "IOError";
        case ErrorType::NetworkError:     return "NetworkError";
        case ErrorType::ParseError:       return "ParseError";
        case ErrorType::InvalidState:     return "InvalidState";
        case ErrorType::Unknown:          return "Unknown";
    }
    return "Unknown";
}

} // namespace viva
