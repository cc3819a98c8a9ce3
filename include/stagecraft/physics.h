/**
 * @file physics.h
 * @brief Chipmunk2D physics backend
 *
 * Wrapper around Chipmunk2D used by actors. Every actor owns exactly one
 * body with exactly one shape; the stage owns the space.
 *
 * Usage:
 *   Stagecraft_PhysicsConfig config = STAGECRAFT_PHYSICS_DEFAULT;
 *   config.gravity_y = -900.0f;
 *   Stagecraft_PhysicsSpace *space = stagecraft_physics_space_create(&config);
 *
 *   Stagecraft_PhysicsBody *body = stagecraft_physics_body_create_dynamic(space, 1.0f, 100.0f);
 *   stagecraft_physics_body_set_position(body, 100, 100);
 *   Stagecraft_PhysicsShape *shape = stagecraft_physics_shape_box(body, 20, 20, 0);
 *
 *   // Each sub-step:
 *   stagecraft_physics_space_step(space, 1.0f / 240.0f);
 *
 *   stagecraft_physics_space_destroy(space);  // Frees all bodies/shapes
 */

#ifndef STAGECRAFT_PHYSICS_H
#define STAGECRAFT_PHYSICS_H

#include "stagecraft/vec2.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Forward Declarations
 * ============================================================================ */

typedef struct Stagecraft_PhysicsSpace Stagecraft_PhysicsSpace;
typedef struct Stagecraft_PhysicsBody Stagecraft_PhysicsBody;
typedef struct Stagecraft_PhysicsShape Stagecraft_PhysicsShape;

/* ============================================================================
 * Constants
 * ============================================================================ */

typedef uint64_t Stagecraft_CollisionType;
typedef uint32_t Stagecraft_CollisionGroup;
typedef uint32_t Stagecraft_CollisionBitmask;

#define STAGECRAFT_PHYSICS_NO_GROUP 0
#define STAGECRAFT_PHYSICS_ALL_CATEGORIES 0xFFFFFFFFu

typedef enum {
    STAGECRAFT_BODY_DYNAMIC = 0,
    STAGECRAFT_BODY_KINEMATIC,
    STAGECRAFT_BODY_STATIC
} Stagecraft_BodyKind;

typedef enum {
    STAGECRAFT_SHAPE_CIRCLE = 0,
    STAGECRAFT_SHAPE_POLYGON,
    STAGECRAFT_SHAPE_SEGMENT,
    STAGECRAFT_SHAPE_UNKNOWN
} Stagecraft_ShapeKind;

/* ============================================================================
 * Configuration
 * ============================================================================ */

typedef struct Stagecraft_PhysicsConfig {
    float gravity_x;              /**< Gravity X (default: 0) */
    float gravity_y;              /**< Gravity Y (default: 0) */
    int iterations;               /**< Solver iterations (default: 10) */
    float damping;                /**< Velocity retained per second (default: 1.0) */
    float sleep_time_threshold;   /**< Idle seconds before sleeping, negative disables (default: 0.3) */
    float collision_slop;         /**< Penetration allowance (default: 0.1) */
} Stagecraft_PhysicsConfig;

#define STAGECRAFT_PHYSICS_DEFAULT { \
    .gravity_x = 0.0f, \
    .gravity_y = 0.0f, \
    .iterations = 10, \
    .damping = 1.0f, \
    .sleep_time_threshold = 0.3f, \
    .collision_slop = 0.1f \
}

/* ============================================================================
 * Contacts
 * ============================================================================ */

/** One contact point of a contact set */
typedef struct Stagecraft_ContactPoint {
    Stagecraft_Vec2 point_a;   /**< Point on the first shape */
    Stagecraft_Vec2 point_b;   /**< Point on the second shape */
    float distance;            /**< Negative when the shapes overlap */
} Stagecraft_ContactPoint;

/**
 * Contact between a queried shape and another shape.
 * The normal points from the queried shape towards the other shape.
 */
typedef struct Stagecraft_Contact {
    Stagecraft_PhysicsShape *shape;        /**< Queried shape */
    Stagecraft_PhysicsShape *other;        /**< Other shape */
    Stagecraft_PhysicsBody *other_body;    /**< Body of the other shape, may be NULL */
    Stagecraft_Vec2 normal;
    int count;
    Stagecraft_ContactPoint points[2];
    Stagecraft_Vec2 total_impulse;         /**< Zero for pure overlap queries */
} Stagecraft_Contact;

/**
 * Contact visitor. Return false to stop iterating.
 */
typedef bool (*Stagecraft_ContactFunc)(const Stagecraft_Contact *contact, void *user_data);

/* ============================================================================
 * Space
 * ============================================================================ */

/**
 * Create a physics space.
 * Caller OWNS and MUST call stagecraft_physics_space_destroy().
 *
 * @param config Configuration (NULL for defaults)
 * @return Physics space, or NULL on failure
 */
Stagecraft_PhysicsSpace *stagecraft_physics_space_create(const Stagecraft_PhysicsConfig *config);

/**
 * Destroy the space together with every body and shape still in it.
 * Safe to call with NULL.
 */
void stagecraft_physics_space_destroy(Stagecraft_PhysicsSpace *space);

void stagecraft_physics_space_step(Stagecraft_PhysicsSpace *space, float dt);

Stagecraft_Vec2 stagecraft_physics_space_get_gravity(const Stagecraft_PhysicsSpace *space);

int stagecraft_physics_space_get_body_count(const Stagecraft_PhysicsSpace *space);
int stagecraft_physics_space_get_shape_count(const Stagecraft_PhysicsSpace *space);

/**
 * Report every shape overlapping @p shape at its current pose.
 * Shapes on the same body are skipped.
 *
 * @return Number of overlapping shapes visited
 */
int stagecraft_physics_space_shape_query(Stagecraft_PhysicsSpace *space,
                                         Stagecraft_PhysicsShape *shape,
                                         Stagecraft_ContactFunc func,
                                         void *user_data);

/* ============================================================================
 * Body
 * ============================================================================ */

/**
 * Create a dynamic body. A non-positive moment falls back to 1.
 * INFINITY is a valid moment and prevents rotation.
 */
Stagecraft_PhysicsBody *stagecraft_physics_body_create_dynamic(Stagecraft_PhysicsSpace *space,
                                                               float mass, float moment);
Stagecraft_PhysicsBody *stagecraft_physics_body_create_kinematic(Stagecraft_PhysicsSpace *space);
Stagecraft_PhysicsBody *stagecraft_physics_body_create_static(Stagecraft_PhysicsSpace *space);

/**
 * Remove the body and its shapes from the space and free them.
 * Safe to call with NULL.
 */
void stagecraft_physics_body_destroy(Stagecraft_PhysicsBody *body);

Stagecraft_BodyKind stagecraft_physics_body_get_kind(const Stagecraft_PhysicsBody *body);
Stagecraft_PhysicsSpace *stagecraft_physics_body_get_space(const Stagecraft_PhysicsBody *body);

/* Transform. Setting position or angle reindexes the body's shapes. */
void stagecraft_physics_body_set_position(Stagecraft_PhysicsBody *body, float x, float y);
Stagecraft_Vec2 stagecraft_physics_body_get_position(const Stagecraft_PhysicsBody *body);

void stagecraft_physics_body_set_angle(Stagecraft_PhysicsBody *body, float radians);
float stagecraft_physics_body_get_angle(const Stagecraft_PhysicsBody *body);

void stagecraft_physics_body_set_velocity(Stagecraft_PhysicsBody *body, float vx, float vy);
Stagecraft_Vec2 stagecraft_physics_body_get_velocity(const Stagecraft_PhysicsBody *body);

void stagecraft_physics_body_set_angular_velocity(Stagecraft_PhysicsBody *body, float w);
float stagecraft_physics_body_get_angular_velocity(const Stagecraft_PhysicsBody *body);

/**
 * Set the mass of a dynamic body.
 *
 * @return false (with error) for non-dynamic bodies or non-positive mass
 */
bool stagecraft_physics_body_set_mass(Stagecraft_PhysicsBody *body, float mass);
float stagecraft_physics_body_get_mass(const Stagecraft_PhysicsBody *body);

/**
 * Set the moment of a dynamic body.
 *
 * @return false (with error) for non-dynamic bodies or non-positive moment
 */
bool stagecraft_physics_body_set_moment(Stagecraft_PhysicsBody *body, float moment);
float stagecraft_physics_body_get_moment(const Stagecraft_PhysicsBody *body);

/* Forces and impulses, application point in body-local coordinates */
void stagecraft_physics_body_apply_force_at_local(Stagecraft_PhysicsBody *body,
                                                  float fx, float fy, float px, float py);
void stagecraft_physics_body_apply_impulse_at_local(Stagecraft_PhysicsBody *body,
                                                    float ix, float iy, float px, float py);

/* Forces and impulses, application point in world coordinates */
void stagecraft_physics_body_apply_force_at_world(Stagecraft_PhysicsBody *body,
                                                  float fx, float fy, float px, float py);
void stagecraft_physics_body_apply_impulse_at_world(Stagecraft_PhysicsBody *body,
                                                    float ix, float iy, float px, float py);

/** Add to the torque accumulated for the next step */
void stagecraft_physics_body_apply_torque(Stagecraft_PhysicsBody *body, float torque);

Stagecraft_Vec2 stagecraft_physics_body_local_to_world(const Stagecraft_PhysicsBody *body, Stagecraft_Vec2 local);
Stagecraft_Vec2 stagecraft_physics_body_world_to_local(const Stagecraft_PhysicsBody *body, Stagecraft_Vec2 world);

/**
 * Visit every arbiter the body currently takes part in.
 * The contact's first shape always belongs to @p body.
 *
 * @return Number of contacts visited
 */
int stagecraft_physics_body_each_contact(Stagecraft_PhysicsBody *body,
                                         Stagecraft_ContactFunc func,
                                         void *user_data);

void stagecraft_physics_body_set_user_data(Stagecraft_PhysicsBody *body, void *data);
void *stagecraft_physics_body_get_user_data(const Stagecraft_PhysicsBody *body);

/* ============================================================================
 * Moment of Inertia Helpers
 * ============================================================================ */

float stagecraft_physics_moment_for_circle(float mass, float inner_radius, float outer_radius);
float stagecraft_physics_moment_for_box(float mass, float width, float height);
float stagecraft_physics_moment_for_polygon(float mass, int vertex_count,
                                            const Stagecraft_Vec2 *vertices, float radius);

/* ============================================================================
 * Shape
 * ============================================================================ */

Stagecraft_PhysicsShape *stagecraft_physics_shape_circle(Stagecraft_PhysicsBody *body,
                                                         float radius, float offset_x, float offset_y);

/** Box centered on the body */
Stagecraft_PhysicsShape *stagecraft_physics_shape_box(Stagecraft_PhysicsBody *body,
                                                      float width, float height, float radius);

/**
 * Convex polygon. Vertices are kept as given (no hull), so pass them
 * counter-clockwise and relative to the body.
 */
Stagecraft_PhysicsShape *stagecraft_physics_shape_polygon(Stagecraft_PhysicsBody *body,
                                                          int vertex_count,
                                                          const Stagecraft_Vec2 *vertices,
                                                          float radius);

Stagecraft_PhysicsShape *stagecraft_physics_shape_segment(Stagecraft_PhysicsBody *body,
                                                          Stagecraft_Vec2 a, Stagecraft_Vec2 b,
                                                          float radius);

Stagecraft_ShapeKind stagecraft_physics_shape_get_kind(const Stagecraft_PhysicsShape *shape);
Stagecraft_PhysicsBody *stagecraft_physics_shape_get_body(const Stagecraft_PhysicsShape *shape);

void stagecraft_physics_shape_set_friction(Stagecraft_PhysicsShape *shape, float friction);
float stagecraft_physics_shape_get_friction(const Stagecraft_PhysicsShape *shape);

void stagecraft_physics_shape_set_elasticity(Stagecraft_PhysicsShape *shape, float elasticity);
float stagecraft_physics_shape_get_elasticity(const Stagecraft_PhysicsShape *shape);

void stagecraft_physics_shape_set_surface_velocity(Stagecraft_PhysicsShape *shape, float vx, float vy);
Stagecraft_Vec2 stagecraft_physics_shape_get_surface_velocity(const Stagecraft_PhysicsShape *shape);

/** Density-derived mass for dynamic bodies; updates the body's mass and moment */
void stagecraft_physics_shape_set_density(Stagecraft_PhysicsShape *shape, float density);

void stagecraft_physics_shape_set_collision_type(Stagecraft_PhysicsShape *shape, Stagecraft_CollisionType type);
Stagecraft_CollisionType stagecraft_physics_shape_get_collision_type(const Stagecraft_PhysicsShape *shape);

/**
 * Shapes in the same non-zero group never collide. A shape collides with
 * another when each one's categories intersect the other's mask.
 */
void stagecraft_physics_shape_set_filter(Stagecraft_PhysicsShape *shape,
                                         Stagecraft_CollisionGroup group,
                                         Stagecraft_CollisionBitmask categories,
                                         Stagecraft_CollisionBitmask mask);
Stagecraft_CollisionGroup stagecraft_physics_shape_get_filter_group(const Stagecraft_PhysicsShape *shape);
Stagecraft_CollisionBitmask stagecraft_physics_shape_get_filter_categories(const Stagecraft_PhysicsShape *shape);
Stagecraft_CollisionBitmask stagecraft_physics_shape_get_filter_mask(const Stagecraft_PhysicsShape *shape);

/**
 * World-space bounding box, recomputed from the body's current pose.
 */
void stagecraft_physics_shape_get_bb(Stagecraft_PhysicsShape *shape,
                                     float *left, float *bottom, float *right, float *top);

/**
 * Signed distance from a world point to the shape surface.
 * Negative inside, zero on the boundary.
 */
float stagecraft_physics_shape_point_query(const Stagecraft_PhysicsShape *shape, float x, float y);

/* Circle geometry */
float stagecraft_physics_circle_get_radius(const Stagecraft_PhysicsShape *shape);
Stagecraft_Vec2 stagecraft_physics_circle_get_offset(const Stagecraft_PhysicsShape *shape);
void stagecraft_physics_circle_set_radius(Stagecraft_PhysicsShape *shape, float radius);

/* Polygon geometry (body-local vertices) */
int stagecraft_physics_polygon_get_count(const Stagecraft_PhysicsShape *shape);
Stagecraft_Vec2 stagecraft_physics_polygon_get_vertex(const Stagecraft_PhysicsShape *shape, int index);
float stagecraft_physics_polygon_get_radius(const Stagecraft_PhysicsShape *shape);
bool stagecraft_physics_polygon_set_vertices(Stagecraft_PhysicsShape *shape, int vertex_count,
                                             const Stagecraft_Vec2 *vertices);

/* Segment geometry (body-local endpoints) */
Stagecraft_Vec2 stagecraft_physics_segment_get_a(const Stagecraft_PhysicsShape *shape);
Stagecraft_Vec2 stagecraft_physics_segment_get_b(const Stagecraft_PhysicsShape *shape);
float stagecraft_physics_segment_get_radius(const Stagecraft_PhysicsShape *shape);
void stagecraft_physics_segment_set_endpoints(Stagecraft_PhysicsShape *shape,
                                              Stagecraft_Vec2 a, Stagecraft_Vec2 b);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_PHYSICS_H */
