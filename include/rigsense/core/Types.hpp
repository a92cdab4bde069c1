#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace rigsense {

// Detection categories. Several agents may serve one category
// (sticking has a mechanical and a differential agent).
enum class Category : uint8_t {
    Sticking = 0,
    WashoutMudLoss = 1,
    HoleCleaning = 2,
    Rop = 3
};

constexpr size_t kCategoryCount = 4;

constexpr std::array<Category, kCategoryCount> kAllCategories = {
    Category::Sticking,
    Category::WashoutMudLoss,
    Category::HoleCleaning,
    Category::Rop
};

enum class Severity : uint8_t {
    Low = 0,
    Medium = 1,
    High = 2,
    Critical = 3
};

const char* toString(Category c);
const char* toString(Severity s);

bool parseCategory(const std::string& text, Category& out);

// Presentation priority, lower wins:
// sticking > washout/mud-loss > hole-cleaning > ROP.
int categoryPriority(Category c);

// Well-known agent names of the reference agents.
namespace agent_names {
constexpr const char* kMechanicalSticking = "mechanical_sticking";
constexpr const char* kDifferentialSticking = "differential_sticking";
constexpr const char* kHoleCleaning = "hole_cleaning";
constexpr const char* kWashoutMudLoss = "washout_mud_losses";
constexpr const char* kRopOptimization = "rop_optimization";
}

} // namespace rigsense
