/*
 * Stagecraft Animation Implementation
 */

#include "stagecraft/animation.h"
#include <SDL3/SDL.h>

double stagecraft_animation_now(void)
{
    return (double)SDL_GetTicksNS() / 1e9;
}

void stagecraft_animation_start_at(Stagecraft_Animation *anim, bool loop, int from_index,
                                   double frame_time_s, double now_s)
{
    if (!anim) return;

    anim->started = true;
    anim->loop = loop;
    anim->frame_time_s = frame_time_s;
    anim->image_index = from_index > 0 ? from_index : 0;
    anim->last_frame_time = now_s;
}

void stagecraft_animation_start(Stagecraft_Animation *anim, bool loop, int from_index, double frame_time_s)
{
    stagecraft_animation_start_at(anim, loop, from_index, frame_time_s, stagecraft_animation_now());
}

void stagecraft_animation_stop(Stagecraft_Animation *anim)
{
    if (!anim) return;
    anim->started = false;
}

void stagecraft_animation_update_at(Stagecraft_Animation *anim, int image_count, double now_s)
{
    if (!anim || !anim->started || image_count <= 0) {
        return;
    }

    if (now_s - anim->last_frame_time <= anim->frame_time_s) {
        return;
    }

    /* Step the time base by one frame so cadence does not drift; resync
     * if updates were so sparse that we are still more than a frame behind */
    anim->last_frame_time += anim->frame_time_s;
    if (now_s - anim->last_frame_time > anim->frame_time_s) {
        anim->last_frame_time = now_s;
    }

    anim->image_index++;

    if (anim->loop) {
        if (anim->image_index >= image_count) {
            anim->image_index = 0;
        }
    } else if (anim->image_index >= image_count - 1) {
        /* One-shot: hold the last frame */
        anim->image_index = image_count - 1;
        anim->started = false;
    }
}

void stagecraft_animation_update(Stagecraft_Animation *anim, int image_count)
{
    stagecraft_animation_update_at(anim, image_count, stagecraft_animation_now());
}

bool stagecraft_animation_is_running(const Stagecraft_Animation *anim)
{
    return anim && anim->started;
}
