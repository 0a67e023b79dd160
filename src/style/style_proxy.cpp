#include <stratum/style/style_proxy.h>

#include <algorithm>
#include <optional>

namespace stratum::style {

namespace {

std::optional<Overflow> parse_overflow(const std::string& keyword) {
    if (keyword == "visible") return Overflow::Visible;
    if (keyword == "hidden") return Overflow::Hidden;
    if (keyword == "scroll") return Overflow::Scroll;
    if (keyword == "auto") return Overflow::Auto;
    return std::nullopt;
}

geom::Matrix to_matrix(const TransformFunction& fn) {
    switch (fn.type) {
        case TransformType::Translate: return geom::Matrix::translation(fn.x, fn.y);
        case TransformType::Rotate:    return geom::Matrix::rotation(fn.angle);
        case TransformType::Scale:     return geom::Matrix::scaling(fn.x, fn.y);
        case TransformType::Skew:      return geom::Matrix::skew(fn.x, fn.y);
        case TransformType::Matrix:
            return geom::Matrix::from_css(fn.m[0], fn.m[1], fn.m[2], fn.m[3], fn.m[4], fn.m[5]);
    }
    return geom::Matrix::identity();
}

} // namespace

void StyleProxy::set_z_index(int value) {
    style_.z_index = ZIndex::integer(value);
}

bool StyleProxy::set_z_index_key(const std::string& keyword) {
    if (keyword.empty()) return false;
    if (keyword == "auto") {
        style_.z_index = ZIndex::auto_value();
    } else {
        // Left for the consumer to reject; the proxy does not resolve
        // inheritance.
        style_.z_index = ZIndex::keyword(keyword);
    }
    return true;
}

bool StyleProxy::set_position(const std::string& keyword) {
    if (keyword == "static") {
        style_.position = Position::Static;
    } else if (keyword == "relative") {
        style_.position = Position::Relative;
    } else if (keyword == "absolute") {
        style_.position = Position::Absolute;
    } else if (keyword == "fixed") {
        style_.position = Position::Fixed;
    } else {
        return false;
    }
    return true;
}

bool StyleProxy::set_vertical_align_key(const std::string& keyword) {
    VerticalAlignKeyword k;
    if (keyword == "baseline") k = VerticalAlignKeyword::Baseline;
    else if (keyword == "top") k = VerticalAlignKeyword::Top;
    else if (keyword == "middle") k = VerticalAlignKeyword::Middle;
    else if (keyword == "bottom") k = VerticalAlignKeyword::Bottom;
    else if (keyword == "text-top") k = VerticalAlignKeyword::TextTop;
    else if (keyword == "text-bottom") k = VerticalAlignKeyword::TextBottom;
    else if (keyword == "sub") k = VerticalAlignKeyword::Sub;
    else if (keyword == "super") k = VerticalAlignKeyword::Super;
    else return false;
    style_.vertical_align = VerticalAlign::from_keyword(k);
    return true;
}

bool StyleProxy::set_vertical_align_num(float value, const std::string& unit) {
    float px = 0;
    if (unit == "%") {
        px = style_.line_height * value / 100.0f;
    } else if (!resolve_length(value, unit, px)) {
        return false;
    }
    style_.vertical_align = VerticalAlign::from_offset(px);
    return true;
}

void StyleProxy::set_opacity(float value) {
    style_.opacity = std::clamp(value, 0.0f, 1.0f);
}

bool StyleProxy::set_overflow_x(const std::string& keyword) {
    auto overflow = parse_overflow(keyword);
    if (!overflow) return false;
    style_.overflow_x = *overflow;
    return true;
}

bool StyleProxy::set_overflow_y(const std::string& keyword) {
    auto overflow = parse_overflow(keyword);
    if (!overflow) return false;
    style_.overflow_y = *overflow;
    return true;
}

bool StyleProxy::set_left(float value, const std::string& unit) {
    return resolve_length(value, unit, style_.left);
}

bool StyleProxy::set_top(float value, const std::string& unit) {
    return resolve_length(value, unit, style_.top);
}

void StyleProxy::set_transform(const std::vector<TransformFunction>& functions) {
    geom::Matrix m = geom::Matrix::identity();
    for (const auto& fn : functions) {
        m = m * to_matrix(fn);
    }
    style_.transform = m;
    style_.has_transform = !functions.empty();
}

void StyleProxy::set_transform_none() {
    style_.transform = geom::Matrix::identity();
    style_.has_transform = false;
}

void StyleProxy::set_transform_origin(float x_fraction, float y_fraction) {
    style_.transform_origin_x = x_fraction;
    style_.transform_origin_y = y_fraction;
}

bool StyleProxy::resolve_length(float value, const std::string& unit, float& out) const {
    if (unit == "px" || (unit.empty() && value == 0)) {
        out = value;
        return true;
    }
    if (unit == "em") {
        out = value * style_.font_size;
        return true;
    }
    return false;
}

} // namespace stratum::style
