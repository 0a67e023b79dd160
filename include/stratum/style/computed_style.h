#pragma once
#include <stratum/core/config.h>
#include <stratum/geom/matrix.h>
#include <cstdint>
#include <string>

namespace stratum::style {

enum class Position { Static, Relative, Absolute, Fixed };
enum class Overflow { Visible, Hidden, Scroll, Auto };
enum class VerticalAlignKeyword { Baseline, Top, Middle, Bottom, TextTop, TextBottom, Sub, Super };

// Resolved z-index. Keyword holds a symbolic value the resolver could not
// reduce to auto or an integer (e.g. an unresolved "inherit").
class ZIndex {
public:
    enum class Kind { Auto, Integer, Keyword };

    static ZIndex auto_value() { return ZIndex(Kind::Auto, 0, ""); }
    static ZIndex integer(int32_t value) { return ZIndex(Kind::Integer, value, ""); }
    static ZIndex keyword(std::string name) { return ZIndex(Kind::Keyword, 0, std::move(name)); }

    Kind kind() const { return kind_; }
    bool is_auto() const { return kind_ == Kind::Auto; }
    bool is_integer() const { return kind_ == Kind::Integer; }
    int32_t value() const { return value_; }
    const std::string& keyword_name() const { return keyword_; }

    std::string to_string() const;

    bool operator==(const ZIndex& o) const {
        return kind_ == o.kind_ && value_ == o.value_ && keyword_ == o.keyword_;
    }
    bool operator!=(const ZIndex& o) const { return !(*this == o); }

private:
    ZIndex(Kind kind, int32_t value, std::string keyword)
        : kind_(kind), value_(value), keyword_(std::move(keyword)) {}

    Kind kind_;
    int32_t value_;
    std::string keyword_;
};

struct VerticalAlign {
    bool is_length = false;
    VerticalAlignKeyword keyword = VerticalAlignKeyword::Baseline;
    float offset = 0; // resolved numeric offset in px, 0 for keywords

    static VerticalAlign from_keyword(VerticalAlignKeyword k) { return {false, k, 0}; }
    static VerticalAlign from_offset(float px) { return {true, VerticalAlignKeyword::Baseline, px}; }

    bool is(VerticalAlignKeyword k) const { return !is_length && keyword == k; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
};

// Style values consumed by the layer tree and line boxes. All lengths are
// already resolved to px by the cascade.
struct ComputedStyle {
    Position position = Position::Static;
    ZIndex z_index = ZIndex::auto_value();
    float opacity = 1.0f;

    bool has_transform = false;
    geom::Matrix transform = geom::Matrix::identity();
    // Fractions of the border box.
    float transform_origin_x = core::config::kDefaultTransformOriginX;
    float transform_origin_y = core::config::kDefaultTransformOriginY;

    VerticalAlign vertical_align;
    Overflow overflow_x = Overflow::Visible;
    Overflow overflow_y = Overflow::Visible;

    // Offsets used for position: relative.
    float left = 0;
    float top = 0;

    float font_size = 16.0f;
    float line_height = 1.2f * 16.0f;
    Color color = Color::black();
    Color background_color = Color::transparent();

    // z-index only applies to positioned boxes; everything else is auto.
    ZIndex resolved_z_index() const {
        if (position == Position::Static) return ZIndex::auto_value();
        return z_index;
    }

    bool is_transparent() const { return opacity < 1.0f; }
    bool is_transformed() const { return has_transform && !transform.is_identity(); }
    bool is_positioned() const { return position != Position::Static; }
};

} // namespace stratum::style
