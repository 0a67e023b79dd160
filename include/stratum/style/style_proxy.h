#pragma once
#include <stratum/style/computed_style.h>
#include <string>
#include <vector>

namespace stratum::style {

enum class TransformType { Translate, Rotate, Scale, Skew, Matrix };

struct TransformFunction {
    TransformType type = TransformType::Translate;
    float x = 0;     // translate: x offset (px), scale: x factor, skew: x angle (deg)
    float y = 0;     // translate: y offset (px), scale: y factor, skew: y angle (deg)
    float angle = 0; // rotate: angle in degrees
    float m[6] = {1, 0, 0, 1, 0, 0}; // matrix(a, b, c, d, e, f)
};

// Applies already-parsed property values to a ComputedStyle. Each setter
// returns false and leaves the style untouched when the keyword or unit is
// not one it understands.
class StyleProxy {
public:
    explicit StyleProxy(ComputedStyle& style) : style_(style) {}

    void set_z_index(int value);
    bool set_z_index_key(const std::string& keyword);

    bool set_position(const std::string& keyword);

    bool set_vertical_align_key(const std::string& keyword);
    // Units: "px", "em" (font size), "%" (line height).
    bool set_vertical_align_num(float value, const std::string& unit);

    void set_opacity(float value);

    bool set_overflow_x(const std::string& keyword);
    bool set_overflow_y(const std::string& keyword);

    bool set_left(float value, const std::string& unit);
    bool set_top(float value, const std::string& unit);

    void set_transform(const std::vector<TransformFunction>& functions);
    void set_transform_none();
    void set_transform_origin(float x_fraction, float y_fraction);

    const ComputedStyle& style() const { return style_; }

private:
    bool resolve_length(float value, const std::string& unit, float& out) const;

    ComputedStyle& style_;
};

} // namespace stratum::style
