#ifndef STAGECRAFT_H
#define STAGECRAFT_H

#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

/* Memory allocation macros */
#define STAGECRAFT_ALLOC(type) (type*)calloc(1, sizeof(type))
#define STAGECRAFT_ALLOC_ARRAY(type, count) (type*)calloc((count), sizeof(type))
#define STAGECRAFT_REALLOC(ptr, type, count) (type*)realloc((ptr), (count) * sizeof(type))
#define STAGECRAFT_FREE(ptr) free(ptr)

/* Version info */
#define STAGECRAFT_VERSION_MAJOR 0
#define STAGECRAFT_VERSION_MINOR 1
#define STAGECRAFT_VERSION_PATCH 0

#include "stagecraft/error.h"
#include "stagecraft/log.h"
#include "stagecraft/vec2.h"
#include "stagecraft/color.h"
#include "stagecraft/physics.h"
#include "stagecraft/shape.h"
#include "stagecraft/camera.h"
#include "stagecraft/canvas.h"
#include "stagecraft/text.h"
#include "stagecraft/assets.h"
#include "stagecraft/animation.h"
#include "stagecraft/costume.h"
#include "stagecraft/render.h"
#include "stagecraft/input.h"
#include "stagecraft/actor.h"
#include "stagecraft/stage.h"

#endif /* STAGECRAFT_H */
