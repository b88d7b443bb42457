#ifndef EXPORTFLOW_MOUSE_CONTROL_H
#define EXPORTFLOW_MOUSE_CONTROL_H

namespace exportflow {
namespace ocal {
namespace mouse {

enum class ClickType {
    SINGLE,
    DOUBLE
};

struct Point {
    int x;
    int y;

    Point(int x = 0, int y = 0) : x(x), y(y) {}
};

/**
 * Move the cursor to a screen point and click the left button
 * @return false where no pointer injection is available
 */
bool clickAt(const Point& point, ClickType type = ClickType::SINGLE);

} // namespace mouse
} // namespace ocal
} // namespace exportflow

#endif // EXPORTFLOW_MOUSE_CONTROL_H
