/**
 * @file physics.cpp
 * @brief Chipmunk2D physics backend implementation
 */

#include "stagecraft/stagecraft.h"
#include "stagecraft/physics.h"
#include "stagecraft/error.h"

#include <chipmunk/chipmunk.h>
#include <chipmunk/chipmunk_structs.h>
#include <chipmunk/chipmunk_unsafe.h>
#include <stdlib.h>
#include <string.h>
#include <math.h>

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct Stagecraft_PhysicsSpace {
    cpSpace *cp_space;
};

struct Stagecraft_PhysicsBody {
    cpBody *cp_body;
    Stagecraft_PhysicsSpace *space;
    Stagecraft_BodyKind kind;
    void *user_data;
};

struct Stagecraft_PhysicsShape {
    cpShape *cp_shape;
    Stagecraft_PhysicsBody *body;
};

/* ============================================================================
 * Helper Functions
 * ============================================================================ */

static inline cpVect to_cpv(float x, float y) {
    return cpv((cpFloat)x, (cpFloat)y);
}

static inline Stagecraft_Vec2 from_cpv(cpVect v) {
    return stagecraft_vec2((float)v.x, (float)v.y);
}

static void fill_contact_points(Stagecraft_Contact *contact, const cpContactPointSet *set) {
    contact->normal = from_cpv(set->normal);
    contact->count = set->count < 2 ? set->count : 2;
    for (int i = 0; i < contact->count; i++) {
        contact->points[i].point_a = from_cpv(set->points[i].pointA);
        contact->points[i].point_b = from_cpv(set->points[i].pointB);
        contact->points[i].distance = (float)set->points[i].distance;
    }
}

/* Shapes moved by hand must be reindexed so queries see the new pose */
static void reindex_body(Stagecraft_PhysicsBody *body) {
    if (!body->space || !body->space->cp_space) return;
    if (cpSpaceIsLocked(body->space->cp_space)) return;
    cpSpaceReindexShapesForBody(body->space->cp_space, body->cp_body);
}

/* ============================================================================
 * Space Implementation
 * ============================================================================ */

Stagecraft_PhysicsSpace *stagecraft_physics_space_create(const Stagecraft_PhysicsConfig *config)
{
    Stagecraft_PhysicsSpace *space = STAGECRAFT_ALLOC(Stagecraft_PhysicsSpace);
    if (!space) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to allocate physics space");
        return NULL;
    }

    space->cp_space = cpSpaceNew();
    if (!space->cp_space) {
        free(space);
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to create Chipmunk space");
        return NULL;
    }

    cpSpaceSetUserData(space->cp_space, space);

    Stagecraft_PhysicsConfig defaults = STAGECRAFT_PHYSICS_DEFAULT;
    const Stagecraft_PhysicsConfig *cfg = config ? config : &defaults;

    cpSpaceSetGravity(space->cp_space, to_cpv(cfg->gravity_x, cfg->gravity_y));
    cpSpaceSetIterations(space->cp_space, cfg->iterations > 0 ? cfg->iterations : 10);
    cpSpaceSetDamping(space->cp_space, (cpFloat)cfg->damping);
    if (cfg->sleep_time_threshold >= 0) {
        cpSpaceSetSleepTimeThreshold(space->cp_space, (cpFloat)cfg->sleep_time_threshold);
    }
    cpSpaceSetCollisionSlop(space->cp_space, (cpFloat)cfg->collision_slop);

    return space;
}

static void collect_body_callback(cpBody *body, void *data) {
    Stagecraft_PhysicsBody ***cursor = (Stagecraft_PhysicsBody ***)data;
    Stagecraft_PhysicsBody *wrapper = (Stagecraft_PhysicsBody *)cpBodyGetUserData(body);
    if (wrapper) {
        **cursor = wrapper;
        (*cursor)++;
    }
}

void stagecraft_physics_space_destroy(Stagecraft_PhysicsSpace *space) {
    if (!space) return;

    if (space->cp_space) {
        /* Bodies can't be removed while iterating, so collect them first */
        int count = stagecraft_physics_space_get_body_count(space);
        if (count > 0) {
            Stagecraft_PhysicsBody **bodies = STAGECRAFT_ALLOC_ARRAY(Stagecraft_PhysicsBody *, count);
            if (bodies) {
                Stagecraft_PhysicsBody **cursor = bodies;
                cpSpaceEachBody(space->cp_space, collect_body_callback, &cursor);
                int collected = (int)(cursor - bodies);
                for (int i = 0; i < collected; i++) {
                    stagecraft_physics_body_destroy(bodies[i]);
                }
                free(bodies);
            }
        }
        cpSpaceFree(space->cp_space);
    }

    free(space);
}

void stagecraft_physics_space_step(Stagecraft_PhysicsSpace *space, float dt) {
    if (!space || !space->cp_space || dt <= 0) return;
    cpSpaceStep(space->cp_space, (cpFloat)dt);
}

Stagecraft_Vec2 stagecraft_physics_space_get_gravity(const Stagecraft_PhysicsSpace *space) {
    if (!space || !space->cp_space) return stagecraft_vec2(0, 0);
    return from_cpv(cpSpaceGetGravity(space->cp_space));
}

static void count_body_callback(cpBody *body, void *data) {
    (void)body;
    (*(int *)data)++;
}

static void count_shape_callback(cpShape *shape, void *data) {
    (void)shape;
    (*(int *)data)++;
}

int stagecraft_physics_space_get_body_count(const Stagecraft_PhysicsSpace *space) {
    if (!space || !space->cp_space) return 0;
    int count = 0;
    cpSpaceEachBody(space->cp_space, count_body_callback, &count);
    return count;
}

int stagecraft_physics_space_get_shape_count(const Stagecraft_PhysicsSpace *space) {
    if (!space || !space->cp_space) return 0;
    int count = 0;
    cpSpaceEachShape(space->cp_space, count_shape_callback, &count);
    return count;
}

struct ShapeQueryContext {
    Stagecraft_PhysicsShape *shape;
    Stagecraft_ContactFunc func;
    void *user_data;
    int visited;
    bool stopped;
};

static void shape_query_callback(cpShape *other, cpContactPointSet *points, void *data) {
    ShapeQueryContext *ctx = (ShapeQueryContext *)data;
    if (ctx->stopped) return;

    Stagecraft_PhysicsShape *other_shape = (Stagecraft_PhysicsShape *)cpShapeGetUserData(other);
    if (!other_shape) return;
    if (other_shape->body == ctx->shape->body) return;

    ctx->visited++;
    if (!ctx->func) return;

    Stagecraft_Contact contact = {};
    contact.shape = ctx->shape;
    contact.other = other_shape;
    contact.other_body = other_shape->body;
    fill_contact_points(&contact, points);

    if (!ctx->func(&contact, ctx->user_data)) {
        ctx->stopped = true;
    }
}

int stagecraft_physics_space_shape_query(Stagecraft_PhysicsSpace *space,
                                         Stagecraft_PhysicsShape *shape,
                                         Stagecraft_ContactFunc func,
                                         void *user_data)
{
    if (!space || !space->cp_space || !shape || !shape->cp_shape) return 0;

    ShapeQueryContext ctx = {shape, func, user_data, 0, false};
    cpSpaceShapeQuery(space->cp_space, shape->cp_shape, shape_query_callback, &ctx);
    return ctx.visited;
}

/* ============================================================================
 * Body Implementation
 * ============================================================================ */

static Stagecraft_PhysicsBody *create_body_wrapper(Stagecraft_PhysicsSpace *space, cpBody *cp_body,
                                                   Stagecraft_BodyKind kind) {
    Stagecraft_PhysicsBody *body = STAGECRAFT_ALLOC(Stagecraft_PhysicsBody);
    if (!body) {
        cpBodyFree(cp_body);
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to allocate physics body wrapper");
        return NULL;
    }

    body->cp_body = cp_body;
    body->space = space;
    body->kind = kind;
    cpBodySetUserData(cp_body, body);
    cpSpaceAddBody(space->cp_space, cp_body);

    return body;
}

Stagecraft_PhysicsBody *stagecraft_physics_body_create_dynamic(Stagecraft_PhysicsSpace *space,
                                                               float mass, float moment)
{
    if (!space || !space->cp_space) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Invalid space");
        return NULL;
    }

    if (!(mass > 0)) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Mass must be positive (got %g)", (double)mass);
        return NULL;
    }

    cpFloat i = moment > 0 ? (cpFloat)moment : 1.0;
    cpBody *cp_body = cpBodyNew((cpFloat)mass, i);
    if (!cp_body) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to create Chipmunk body");
        return NULL;
    }

    return create_body_wrapper(space, cp_body, STAGECRAFT_BODY_DYNAMIC);
}

Stagecraft_PhysicsBody *stagecraft_physics_body_create_kinematic(Stagecraft_PhysicsSpace *space)
{
    if (!space || !space->cp_space) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Invalid space");
        return NULL;
    }

    cpBody *cp_body = cpBodyNewKinematic();
    if (!cp_body) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to create Chipmunk kinematic body");
        return NULL;
    }

    return create_body_wrapper(space, cp_body, STAGECRAFT_BODY_KINEMATIC);
}

Stagecraft_PhysicsBody *stagecraft_physics_body_create_static(Stagecraft_PhysicsSpace *space)
{
    if (!space || !space->cp_space) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Invalid space");
        return NULL;
    }

    cpBody *cp_body = cpBodyNewStatic();
    if (!cp_body) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to create Chipmunk static body");
        return NULL;
    }

    return create_body_wrapper(space, cp_body, STAGECRAFT_BODY_STATIC);
}

static void free_shape_callback(cpBody *body, cpShape *shape, void *data) {
    (void)body;
    cpSpace *cp_space = (cpSpace *)data;
    Stagecraft_PhysicsShape *wrapper = (Stagecraft_PhysicsShape *)cpShapeGetUserData(shape);
    cpSpaceRemoveShape(cp_space, shape);
    cpShapeFree(shape);
    free(wrapper);
}

void stagecraft_physics_body_destroy(Stagecraft_PhysicsBody *body) {
    if (!body) return;

    if (body->cp_body && body->space && body->space->cp_space) {
        cpSpace *cp_space = body->space->cp_space;
        cpBodyEachShape(body->cp_body, free_shape_callback, cp_space);
        cpSpaceRemoveBody(cp_space, body->cp_body);
        cpBodyFree(body->cp_body);
    }

    free(body);
}

Stagecraft_BodyKind stagecraft_physics_body_get_kind(const Stagecraft_PhysicsBody *body) {
    return body ? body->kind : STAGECRAFT_BODY_STATIC;
}

Stagecraft_PhysicsSpace *stagecraft_physics_body_get_space(const Stagecraft_PhysicsBody *body) {
    return body ? body->space : NULL;
}

/* Body transform */
void stagecraft_physics_body_set_position(Stagecraft_PhysicsBody *body, float x, float y) {
    if (!body || !body->cp_body) return;
    cpBodySetPosition(body->cp_body, to_cpv(x, y));
    reindex_body(body);
}

Stagecraft_Vec2 stagecraft_physics_body_get_position(const Stagecraft_PhysicsBody *body) {
    if (!body || !body->cp_body) return stagecraft_vec2(0, 0);
    return from_cpv(cpBodyGetPosition(body->cp_body));
}

void stagecraft_physics_body_set_angle(Stagecraft_PhysicsBody *body, float radians) {
    if (!body || !body->cp_body) return;
    cpBodySetAngle(body->cp_body, (cpFloat)radians);
    reindex_body(body);
}

float stagecraft_physics_body_get_angle(const Stagecraft_PhysicsBody *body) {
    if (!body || !body->cp_body) return 0.0f;
    return (float)cpBodyGetAngle(body->cp_body);
}

void stagecraft_physics_body_set_velocity(Stagecraft_PhysicsBody *body, float vx, float vy) {
    if (!body || !body->cp_body) return;
    cpBodySetVelocity(body->cp_body, to_cpv(vx, vy));
}

Stagecraft_Vec2 stagecraft_physics_body_get_velocity(const Stagecraft_PhysicsBody *body) {
    if (!body || !body->cp_body) return stagecraft_vec2(0, 0);
    return from_cpv(cpBodyGetVelocity(body->cp_body));
}

void stagecraft_physics_body_set_angular_velocity(Stagecraft_PhysicsBody *body, float w) {
    if (!body || !body->cp_body) return;
    cpBodySetAngularVelocity(body->cp_body, (cpFloat)w);
}

float stagecraft_physics_body_get_angular_velocity(const Stagecraft_PhysicsBody *body) {
    if (!body || !body->cp_body) return 0.0f;
    return (float)cpBodyGetAngularVelocity(body->cp_body);
}

/* Body mass properties. Chipmunk asserts on these for non-dynamic bodies. */
bool stagecraft_physics_body_set_mass(Stagecraft_PhysicsBody *body, float mass) {
    if (!body || !body->cp_body) return false;
    if (body->kind != STAGECRAFT_BODY_DYNAMIC) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Mass can only be set on dynamic bodies");
        return false;
    }
    if (!(mass > 0)) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Mass must be positive (got %g)", (double)mass);
        return false;
    }
    cpBodySetMass(body->cp_body, (cpFloat)mass);
    return true;
}

float stagecraft_physics_body_get_mass(const Stagecraft_PhysicsBody *body) {
    if (!body || !body->cp_body) return 0.0f;
    return (float)cpBodyGetMass(body->cp_body);
}

bool stagecraft_physics_body_set_moment(Stagecraft_PhysicsBody *body, float moment) {
    if (!body || !body->cp_body) return false;
    if (body->kind != STAGECRAFT_BODY_DYNAMIC) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Moment can only be set on dynamic bodies");
        return false;
    }
    if (!(moment > 0)) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Moment must be positive (got %g)", (double)moment);
        return false;
    }
    cpBodySetMoment(body->cp_body, (cpFloat)moment);
    return true;
}

float stagecraft_physics_body_get_moment(const Stagecraft_PhysicsBody *body) {
    if (!body || !body->cp_body) return 0.0f;
    return (float)cpBodyGetMoment(body->cp_body);
}

/* Forces and impulses */
void stagecraft_physics_body_apply_force_at_local(Stagecraft_PhysicsBody *body,
                                                  float fx, float fy, float px, float py) {
    if (!body || !body->cp_body) return;
    cpBodyApplyForceAtLocalPoint(body->cp_body, to_cpv(fx, fy), to_cpv(px, py));
}

void stagecraft_physics_body_apply_impulse_at_local(Stagecraft_PhysicsBody *body,
                                                    float ix, float iy, float px, float py) {
    if (!body || !body->cp_body) return;
    cpBodyApplyImpulseAtLocalPoint(body->cp_body, to_cpv(ix, iy), to_cpv(px, py));
}

void stagecraft_physics_body_apply_force_at_world(Stagecraft_PhysicsBody *body,
                                                  float fx, float fy, float px, float py) {
    if (!body || !body->cp_body) return;
    cpBodyApplyForceAtWorldPoint(body->cp_body, to_cpv(fx, fy), to_cpv(px, py));
}

void stagecraft_physics_body_apply_impulse_at_world(Stagecraft_PhysicsBody *body,
                                                    float ix, float iy, float px, float py) {
    if (!body || !body->cp_body) return;
    cpBodyApplyImpulseAtWorldPoint(body->cp_body, to_cpv(ix, iy), to_cpv(px, py));
}

void stagecraft_physics_body_apply_torque(Stagecraft_PhysicsBody *body, float torque) {
    if (!body || !body->cp_body) return;
    cpBodySetTorque(body->cp_body, cpBodyGetTorque(body->cp_body) + (cpFloat)torque);
}

Stagecraft_Vec2 stagecraft_physics_body_local_to_world(const Stagecraft_PhysicsBody *body, Stagecraft_Vec2 local) {
    if (!body || !body->cp_body) return local;
    return from_cpv(cpBodyLocalToWorld(body->cp_body, to_cpv(local.x, local.y)));
}

Stagecraft_Vec2 stagecraft_physics_body_world_to_local(const Stagecraft_PhysicsBody *body, Stagecraft_Vec2 world) {
    if (!body || !body->cp_body) return world;
    return from_cpv(cpBodyWorldToLocal(body->cp_body, to_cpv(world.x, world.y)));
}

struct EachContactContext {
    Stagecraft_PhysicsBody *body;
    Stagecraft_ContactFunc func;
    void *user_data;
    int visited;
    bool stopped;
};

static void each_arbiter_callback(cpBody *cp_body, cpArbiter *arb, void *data) {
    (void)cp_body;
    EachContactContext *ctx = (EachContactContext *)data;
    if (ctx->stopped) return;

    /* Chipmunk orders the pair so the first shape is on the iterated body */
    cpShape *a, *b;
    cpArbiterGetShapes(arb, &a, &b);

    Stagecraft_Contact contact = {};
    contact.shape = (Stagecraft_PhysicsShape *)cpShapeGetUserData(a);
    contact.other = (Stagecraft_PhysicsShape *)cpShapeGetUserData(b);
    contact.other_body = contact.other ? contact.other->body : NULL;

    cpContactPointSet set = cpArbiterGetContactPointSet(arb);
    fill_contact_points(&contact, &set);
    contact.total_impulse = from_cpv(cpArbiterTotalImpulse(arb));

    ctx->visited++;
    if (ctx->func && !ctx->func(&contact, ctx->user_data)) {
        ctx->stopped = true;
    }
}

int stagecraft_physics_body_each_contact(Stagecraft_PhysicsBody *body,
                                         Stagecraft_ContactFunc func,
                                         void *user_data)
{
    if (!body || !body->cp_body) return 0;

    EachContactContext ctx = {body, func, user_data, 0, false};
    cpBodyEachArbiter(body->cp_body, each_arbiter_callback, &ctx);
    return ctx.visited;
}

void stagecraft_physics_body_set_user_data(Stagecraft_PhysicsBody *body, void *data) {
    if (!body) return;
    body->user_data = data;
}

void *stagecraft_physics_body_get_user_data(const Stagecraft_PhysicsBody *body) {
    return body ? body->user_data : NULL;
}

/* ============================================================================
 * Moment of Inertia Helpers
 * ============================================================================ */

float stagecraft_physics_moment_for_circle(float mass, float inner_radius, float outer_radius) {
    return (float)cpMomentForCircle((cpFloat)mass, (cpFloat)inner_radius, (cpFloat)outer_radius, cpvzero);
}

float stagecraft_physics_moment_for_box(float mass, float width, float height) {
    return (float)cpMomentForBox((cpFloat)mass, (cpFloat)width, (cpFloat)height);
}

float stagecraft_physics_moment_for_polygon(float mass, int vertex_count,
                                            const Stagecraft_Vec2 *vertices, float radius) {
    if (!vertices || vertex_count <= 0) return 0.0f;

    cpVect *verts = STAGECRAFT_ALLOC_ARRAY(cpVect, vertex_count);
    if (!verts) return 0.0f;

    for (int i = 0; i < vertex_count; i++) {
        verts[i] = to_cpv(vertices[i].x, vertices[i].y);
    }

    float result = (float)cpMomentForPoly((cpFloat)mass, vertex_count, verts, cpvzero, (cpFloat)radius);
    free(verts);
    return result;
}

/* ============================================================================
 * Shape Implementation
 * ============================================================================ */

static Stagecraft_PhysicsShape *create_shape_wrapper(Stagecraft_PhysicsBody *body, cpShape *cp_shape) {
    if (!cp_shape) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to create Chipmunk shape");
        return NULL;
    }

    Stagecraft_PhysicsShape *shape = STAGECRAFT_ALLOC(Stagecraft_PhysicsShape);
    if (!shape) {
        cpShapeFree(cp_shape);
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to allocate physics shape wrapper");
        return NULL;
    }

    shape->cp_shape = cp_shape;
    shape->body = body;
    cpShapeSetUserData(cp_shape, shape);
    cpSpaceAddShape(body->space->cp_space, cp_shape);

    return shape;
}

Stagecraft_PhysicsShape *stagecraft_physics_shape_circle(Stagecraft_PhysicsBody *body,
                                                         float radius, float offset_x, float offset_y)
{
    if (!body || !body->cp_body) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Invalid body");
        return NULL;
    }

    cpShape *cp_shape = cpCircleShapeNew(body->cp_body, (cpFloat)radius, to_cpv(offset_x, offset_y));
    return create_shape_wrapper(body, cp_shape);
}

Stagecraft_PhysicsShape *stagecraft_physics_shape_box(Stagecraft_PhysicsBody *body,
                                                      float width, float height, float radius)
{
    if (!body || !body->cp_body) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Invalid body");
        return NULL;
    }

    cpShape *cp_shape = cpBoxShapeNew(body->cp_body, (cpFloat)width, (cpFloat)height, (cpFloat)radius);
    return create_shape_wrapper(body, cp_shape);
}

Stagecraft_PhysicsShape *stagecraft_physics_shape_polygon(Stagecraft_PhysicsBody *body,
                                                          int vertex_count,
                                                          const Stagecraft_Vec2 *vertices,
                                                          float radius)
{
    if (!body || !body->cp_body) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Invalid body");
        return NULL;
    }

    if (!vertices || vertex_count < 3) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Polygon needs at least 3 vertices (got %d)", vertex_count);
        return NULL;
    }

    cpVect *verts = STAGECRAFT_ALLOC_ARRAY(cpVect, vertex_count);
    if (!verts) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to allocate vertex array");
        return NULL;
    }

    for (int i = 0; i < vertex_count; i++) {
        verts[i] = to_cpv(vertices[i].x, vertices[i].y);
    }

    cpShape *cp_shape = cpPolyShapeNewRaw(body->cp_body, vertex_count, verts, (cpFloat)radius);
    free(verts);

    return create_shape_wrapper(body, cp_shape);
}

Stagecraft_PhysicsShape *stagecraft_physics_shape_segment(Stagecraft_PhysicsBody *body,
                                                          Stagecraft_Vec2 a, Stagecraft_Vec2 b,
                                                          float radius)
{
    if (!body || !body->cp_body) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Invalid body");
        return NULL;
    }

    cpShape *cp_shape = cpSegmentShapeNew(body->cp_body, to_cpv(a.x, a.y), to_cpv(b.x, b.y), (cpFloat)radius);
    return create_shape_wrapper(body, cp_shape);
}

Stagecraft_ShapeKind stagecraft_physics_shape_get_kind(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return STAGECRAFT_SHAPE_UNKNOWN;

    /* Shape class is only reachable through the struct (chipmunk_structs.h) */
    switch (shape->cp_shape->klass->type) {
        case CP_CIRCLE_SHAPE:  return STAGECRAFT_SHAPE_CIRCLE;
        case CP_POLY_SHAPE:    return STAGECRAFT_SHAPE_POLYGON;
        case CP_SEGMENT_SHAPE: return STAGECRAFT_SHAPE_SEGMENT;
        default:               return STAGECRAFT_SHAPE_UNKNOWN;
    }
}

Stagecraft_PhysicsBody *stagecraft_physics_shape_get_body(const Stagecraft_PhysicsShape *shape) {
    return shape ? shape->body : NULL;
}

/* Shape properties */
void stagecraft_physics_shape_set_friction(Stagecraft_PhysicsShape *shape, float friction) {
    if (!shape || !shape->cp_shape) return;
    cpShapeSetFriction(shape->cp_shape, (cpFloat)friction);
}

float stagecraft_physics_shape_get_friction(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0.0f;
    return (float)cpShapeGetFriction(shape->cp_shape);
}

void stagecraft_physics_shape_set_elasticity(Stagecraft_PhysicsShape *shape, float elasticity) {
    if (!shape || !shape->cp_shape) return;
    cpShapeSetElasticity(shape->cp_shape, (cpFloat)elasticity);
}

float stagecraft_physics_shape_get_elasticity(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0.0f;
    return (float)cpShapeGetElasticity(shape->cp_shape);
}

void stagecraft_physics_shape_set_surface_velocity(Stagecraft_PhysicsShape *shape, float vx, float vy) {
    if (!shape || !shape->cp_shape) return;
    cpShapeSetSurfaceVelocity(shape->cp_shape, to_cpv(vx, vy));
}

Stagecraft_Vec2 stagecraft_physics_shape_get_surface_velocity(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return stagecraft_vec2(0, 0);
    return from_cpv(cpShapeGetSurfaceVelocity(shape->cp_shape));
}

void stagecraft_physics_shape_set_density(Stagecraft_PhysicsShape *shape, float density) {
    if (!shape || !shape->cp_shape) return;
    if (shape->body->kind != STAGECRAFT_BODY_DYNAMIC) return;
    cpShapeSetDensity(shape->cp_shape, (cpFloat)density);
}

void stagecraft_physics_shape_set_collision_type(Stagecraft_PhysicsShape *shape, Stagecraft_CollisionType type) {
    if (!shape || !shape->cp_shape) return;
    cpShapeSetCollisionType(shape->cp_shape, (cpCollisionType)type);
}

Stagecraft_CollisionType stagecraft_physics_shape_get_collision_type(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0;
    return (Stagecraft_CollisionType)cpShapeGetCollisionType(shape->cp_shape);
}

void stagecraft_physics_shape_set_filter(Stagecraft_PhysicsShape *shape,
                                         Stagecraft_CollisionGroup group,
                                         Stagecraft_CollisionBitmask categories,
                                         Stagecraft_CollisionBitmask mask) {
    if (!shape || !shape->cp_shape) return;
    cpShapeSetFilter(shape->cp_shape, cpShapeFilterNew((cpGroup)group, (cpBitmask)categories, (cpBitmask)mask));
}

Stagecraft_CollisionGroup stagecraft_physics_shape_get_filter_group(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return STAGECRAFT_PHYSICS_NO_GROUP;
    return (Stagecraft_CollisionGroup)cpShapeGetFilter(shape->cp_shape).group;
}

Stagecraft_CollisionBitmask stagecraft_physics_shape_get_filter_categories(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0;
    return (Stagecraft_CollisionBitmask)cpShapeGetFilter(shape->cp_shape).categories;
}

Stagecraft_CollisionBitmask stagecraft_physics_shape_get_filter_mask(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0;
    return (Stagecraft_CollisionBitmask)cpShapeGetFilter(shape->cp_shape).mask;
}

void stagecraft_physics_shape_get_bb(Stagecraft_PhysicsShape *shape,
                                     float *left, float *bottom, float *right, float *top) {
    cpBB bb = {0, 0, 0, 0};
    if (shape && shape->cp_shape) {
        bb = cpShapeCacheBB(shape->cp_shape);
    }
    if (left) *left = (float)bb.l;
    if (bottom) *bottom = (float)bb.b;
    if (right) *right = (float)bb.r;
    if (top) *top = (float)bb.t;
}

float stagecraft_physics_shape_point_query(const Stagecraft_PhysicsShape *shape, float x, float y) {
    if (!shape || !shape->cp_shape) return INFINITY;

    /* cpShapePointQuery reads the cached transform, so refresh it first */
    cpShapeCacheBB(shape->cp_shape);
    cpPointQueryInfo info;
    return (float)cpShapePointQuery(shape->cp_shape, to_cpv(x, y), &info);
}

/* Circle geometry */
float stagecraft_physics_circle_get_radius(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0.0f;
    return (float)cpCircleShapeGetRadius(shape->cp_shape);
}

Stagecraft_Vec2 stagecraft_physics_circle_get_offset(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return stagecraft_vec2(0, 0);
    return from_cpv(cpCircleShapeGetOffset(shape->cp_shape));
}

void stagecraft_physics_circle_set_radius(Stagecraft_PhysicsShape *shape, float radius) {
    if (!shape || !shape->cp_shape) return;
    cpCircleShapeSetRadius(shape->cp_shape, (cpFloat)radius);
    reindex_body(shape->body);
}

/* Polygon geometry */
int stagecraft_physics_polygon_get_count(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0;
    return cpPolyShapeGetCount(shape->cp_shape);
}

Stagecraft_Vec2 stagecraft_physics_polygon_get_vertex(const Stagecraft_PhysicsShape *shape, int index) {
    if (!shape || !shape->cp_shape) return stagecraft_vec2(0, 0);
    return from_cpv(cpPolyShapeGetVert(shape->cp_shape, index));
}

float stagecraft_physics_polygon_get_radius(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0.0f;
    return (float)cpPolyShapeGetRadius(shape->cp_shape);
}

bool stagecraft_physics_polygon_set_vertices(Stagecraft_PhysicsShape *shape, int vertex_count,
                                             const Stagecraft_Vec2 *vertices) {
    if (!shape || !shape->cp_shape) return false;
    if (!vertices || vertex_count < 3) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_CONFIG, "Polygon needs at least 3 vertices (got %d)", vertex_count);
        return false;
    }

    cpVect *verts = STAGECRAFT_ALLOC_ARRAY(cpVect, vertex_count);
    if (!verts) {
        stagecraft_set_error_kind(STAGECRAFT_ERROR_BACKEND, "Failed to allocate vertex array");
        return false;
    }
    for (int i = 0; i < vertex_count; i++) {
        verts[i] = to_cpv(vertices[i].x, vertices[i].y);
    }

    cpPolyShapeSetVertsRaw(shape->cp_shape, vertex_count, verts);
    free(verts);
    reindex_body(shape->body);
    return true;
}

/* Segment geometry */
Stagecraft_Vec2 stagecraft_physics_segment_get_a(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return stagecraft_vec2(0, 0);
    return from_cpv(cpSegmentShapeGetA(shape->cp_shape));
}

Stagecraft_Vec2 stagecraft_physics_segment_get_b(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return stagecraft_vec2(0, 0);
    return from_cpv(cpSegmentShapeGetB(shape->cp_shape));
}

float stagecraft_physics_segment_get_radius(const Stagecraft_PhysicsShape *shape) {
    if (!shape || !shape->cp_shape) return 0.0f;
    return (float)cpSegmentShapeGetRadius(shape->cp_shape);
}

void stagecraft_physics_segment_set_endpoints(Stagecraft_PhysicsShape *shape,
                                              Stagecraft_Vec2 a, Stagecraft_Vec2 b) {
    if (!shape || !shape->cp_shape) return;
    cpSegmentShapeSetEndpoints(shape->cp_shape, to_cpv(a.x, a.y), to_cpv(b.x, b.y));
    reindex_body(shape->body);
}

