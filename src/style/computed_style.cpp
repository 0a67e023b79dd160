#include <stratum/style/computed_style.h>

namespace stratum::style {

std::string ZIndex::to_string() const {
    switch (kind_) {
        case Kind::Auto:    return "auto";
        case Kind::Integer: return std::to_string(value_);
        case Kind::Keyword: return keyword_;
    }
    return "";
}

} // namespace stratum::style
