#include <multirender/paint_scene.hpp>

namespace multirender {

void PaintScene::DrawImage(const ImageBrush& image, const Affine& transform) {
  const Rect bounds{0.0, 0.0, (f64)image.image.width, (f64)image.image.height};

  Fill(FillRule::NonZero, transform, image, std::nullopt, bounds);
}

} // namespace multirender
