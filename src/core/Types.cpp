#include "rigsense/core/Types.hpp"

namespace rigsense {

const char* toString(Category c) {
    switch (c) {
        case Category::Sticking:       return "sticking";
        case Category::WashoutMudLoss: return "washout_mud_loss";
        case Category::HoleCleaning:   return "hole_cleaning";
        case Category::Rop:            return "rop";
    }
    return "unknown";
}

const char* toString(Severity s) {
    switch (s) {
        case Severity::Low:      return "LOW";
        case Severity::Medium:   return "MEDIUM";
        case Severity::High:     return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

bool parseCategory(const std::string& text, Category& out) {
    for (Category c : kAllCategories) {
        if (text == toString(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

int categoryPriority(Category c) {
    switch (c) {
        case Category::Sticking:       return 0;
        case Category::WashoutMudLoss: return 1;
        case Category::HoleCleaning:   return 2;
        case Category::Rop:            return 3;
    }
    return 99;
}

} // namespace rigsense
