#include "rigsense/alerts/Alert.hpp"

#include <algorithm>
#include <cctype>

namespace rigsense {

bool parseFeedbackKind(const std::string& text, FeedbackKind& out) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });

    for (FeedbackKind k : {FeedbackKind::Confirmed,
                           FeedbackKind::FalsePositive,
                           FeedbackKind::Missed}) {
        if (upper == toString(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

} // namespace rigsense
