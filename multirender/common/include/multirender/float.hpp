#pragma once

namespace multirender {

using f32 = float;
using f64 = double;

} // namespace multirender
