/*
 * Stagecraft Animation
 *
 * Wall-clock frame stepper embedded in every costume. Frames advance on
 * real elapsed time, never on tick count, so animation speed does not
 * depend on the physics or render rate.
 *
 * Usage:
 *   Stagecraft_Animation anim = STAGECRAFT_ANIMATION_DEFAULT;
 *   stagecraft_animation_start(&anim, true, 0, 0.2);
 *
 *   // Each frame:
 *   stagecraft_animation_update(&anim, image_count);
 *   int frame = anim.image_index;
 */

#ifndef STAGECRAFT_ANIMATION_H
#define STAGECRAFT_ANIMATION_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Stagecraft_Animation {
    double frame_time_s;      /**< Seconds per frame */
    double last_frame_time;   /**< Time base of the current frame, seconds */
    bool loop;                /**< Wrap to frame 0 after the last frame */
    bool started;
    int image_index;
} Stagecraft_Animation;

#define STAGECRAFT_ANIMATION_DEFAULT { \
    .frame_time_s = 0.1, \
    .last_frame_time = 0.0, \
    .loop = true, \
    .started = false, \
    .image_index = 0 \
}

/* Monotonic seconds used by the wall-clock variants */
double stagecraft_animation_now(void);

/**
 * Start playing from from_index. The frame timer starts now.
 */
void stagecraft_animation_start(Stagecraft_Animation *anim, bool loop, int from_index, double frame_time_s);
void stagecraft_animation_start_at(Stagecraft_Animation *anim, bool loop, int from_index,
                                   double frame_time_s, double now_s);

void stagecraft_animation_stop(Stagecraft_Animation *anim);

/**
 * Advance at most one frame when more than frame_time_s has passed since
 * the current frame began. A looping animation wraps to 0; a one-shot
 * animation stops on its last frame. No-op unless started.
 */
void stagecraft_animation_update(Stagecraft_Animation *anim, int image_count);
void stagecraft_animation_update_at(Stagecraft_Animation *anim, int image_count, double now_s);

bool stagecraft_animation_is_running(const Stagecraft_Animation *anim);

#ifdef __cplusplus
}
#endif

#endif /* STAGECRAFT_ANIMATION_H */
