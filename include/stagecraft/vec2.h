/*
 * Stagecraft 2D vector math
 * Small value type shared by physics, camera and actor code.
 * World coordinates are y-up.
 */

#ifndef STAGECRAFT_VEC2_H
#define STAGECRAFT_VEC2_H

#include <math.h>

typedef struct Stagecraft_Vec2 {
    float x;
    float y;
} Stagecraft_Vec2;

#define STAGECRAFT_PI 3.14159265358979323846f
#define STAGECRAFT_DEG_TO_RAD(d) ((d) * 0.01745329251994329576923690768489f)
#define STAGECRAFT_RAD_TO_DEG(r) ((r) * 57.295779513082320876798154814105f)

static inline Stagecraft_Vec2 stagecraft_vec2(float x, float y) {
    Stagecraft_Vec2 v = {x, y};
    return v;
}

static inline Stagecraft_Vec2 stagecraft_vec2_add(Stagecraft_Vec2 a, Stagecraft_Vec2 b) {
    return stagecraft_vec2(a.x + b.x, a.y + b.y);
}

static inline Stagecraft_Vec2 stagecraft_vec2_sub(Stagecraft_Vec2 a, Stagecraft_Vec2 b) {
    return stagecraft_vec2(a.x - b.x, a.y - b.y);
}

static inline Stagecraft_Vec2 stagecraft_vec2_scale(Stagecraft_Vec2 v, float s) {
    return stagecraft_vec2(v.x * s, v.y * s);
}

static inline float stagecraft_vec2_dot(Stagecraft_Vec2 a, Stagecraft_Vec2 b) {
    return a.x * b.x + a.y * b.y;
}

static inline float stagecraft_vec2_length(Stagecraft_Vec2 v) {
    return sqrtf(v.x * v.x + v.y * v.y);
}

static inline float stagecraft_vec2_distance(Stagecraft_Vec2 a, Stagecraft_Vec2 b) {
    return stagecraft_vec2_length(stagecraft_vec2_sub(a, b));
}

/* Zero vector stays zero */
static inline Stagecraft_Vec2 stagecraft_vec2_normalize(Stagecraft_Vec2 v) {
    float len = stagecraft_vec2_length(v);
    if (len <= 0.0f) return stagecraft_vec2(0.0f, 0.0f);
    return stagecraft_vec2(v.x / len, v.y / len);
}

/* Counter-clockwise rotation by radians */
static inline Stagecraft_Vec2 stagecraft_vec2_rotate(Stagecraft_Vec2 v, float radians) {
    float c = cosf(radians);
    float s = sinf(radians);
    return stagecraft_vec2(v.x * c - v.y * s, v.x * s + v.y * c);
}

/* Angle from +x axis in radians */
static inline float stagecraft_vec2_angle(Stagecraft_Vec2 v) {
    return atan2f(v.y, v.x);
}

#endif /* STAGECRAFT_VEC2_H */
