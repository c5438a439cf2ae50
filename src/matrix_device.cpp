#include "matrix_device.h"

Canvas::Canvas(MatrixDevice& device)
  : dev(device),
    frame(device.width(), device.height()) {}

Canvas::~Canvas() {
  dev.show(frame);
}
