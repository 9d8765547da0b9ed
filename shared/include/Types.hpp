// shared/include/Types.hpp
#pragma once

#include <cstdint>
#include <cstddef>
#include <iterator>
#include <vector>

namespace Quadra {

// Forward declarations
class RenderContext;
class GraphicsDevice;
class BatchRenderer;

// Basic geometric types
struct Vec2 {
    float x, y;

    Vec2() : x(0), y(0) {}
    Vec2(float x_, float y_) : x(x_), y(y_) {}

    Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }
    Vec2 operator*(float scale) const { return {x * scale, y * scale}; }

    bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }
};

class RectangleSequence;

struct Rectangle {
    float x, y, width, height;

    Rectangle() : x(0), y(0), width(0), height(0) {}
    Rectangle(float x_, float y_, float w_, float h_) : x(x_), y(y_), width(w_), height(h_) {}

    bool contains(const Vec2& point) const {
        return point.x >= x && point.x <= x + width &&
               point.y >= y && point.y <= y + height;
    }

    bool operator==(const Rectangle& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
    bool operator!=(const Rectangle& other) const { return !(*this == other); }

    /**
     * @brief Infinite sequence of horizontally adjacent rectangles
     *
     * Term n is {x + n * width, y, width, height}. Useful for slicing
     * spritesheets; bound the consumption with take() or a break.
     */
    static RectangleSequence row(float x, float y, float width, float height);

    /**
     * @brief Infinite sequence of vertically adjacent rectangles
     *
     * Term n is {x, y + n * height, width, height}.
     */
    static RectangleSequence column(float x, float y, float width, float height);
};

/**
 * @brief Lazy, unbounded sequence of adjacent rectangles
 *
 * Every begin() restarts from the first rectangle; iterators are never
 * shared between loops. end() is a sentinel that no iterator reaches.
 */
class RectangleSequence {
public:
    enum class Axis : uint8_t {
        Horizontal,
        Vertical
    };

    struct Sentinel {};

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Rectangle;
        using difference_type = std::ptrdiff_t;
        using pointer = const Rectangle*;
        using reference = const Rectangle&;

        Iterator(const Rectangle& start, Axis axis) : m_current(start), m_axis(axis) {}

        reference operator*() const { return m_current; }
        pointer operator->() const { return &m_current; }

        Iterator& operator++() {
            if (m_axis == Axis::Horizontal) {
                m_current.x += m_current.width;
            } else {
                m_current.y += m_current.height;
            }
            return *this;
        }

        Iterator operator++(int) {
            Iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(Sentinel) const { return false; }
        bool operator!=(Sentinel) const { return true; }

    private:
        Rectangle m_current;
        Axis m_axis;
    };

public:
    RectangleSequence(const Rectangle& start, Axis axis) : m_start(start), m_axis(axis) {}

    Iterator begin() const { return Iterator(m_start, m_axis); }
    Sentinel end() const { return Sentinel{}; }

    // First `count` rectangles of the sequence
    std::vector<Rectangle> take(size_t count) const;

    const Rectangle& first() const { return m_start; }
    Axis axis() const { return m_axis; }

private:
    Rectangle m_start;
    Axis m_axis;
};

struct Color {
    float r, g, b, a;

    Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}
    Color(float r_, float g_, float b_, float a_ = 1.0f) : r(r_), g(g_), b(b_), a(a_) {}

    static Color rgb(float r, float g, float b) { return Color(r, g, b, 1.0f); }
    static Color rgba(float r, float g, float b, float a) { return Color(r, g, b, a); }
    static Color rgb8(uint8_t r, uint8_t g, uint8_t b) { return rgba8(r, g, b, 255); }
    static Color rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
        return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
    }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    // Common colors
    static const Color WHITE;
    static const Color BLACK;
    static const Color RED;
    static const Color GREEN;
    static const Color BLUE;
    static const Color TRANSPARENT;
};

// Buffer usage hints forwarded to the graphics device
enum class BufferUsage : uint8_t {
    StaticDraw,
    DynamicDraw
};

} // namespace Quadra
