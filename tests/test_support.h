/*
 * Shared fixtures for the Stagecraft tests
 */

#ifndef STAGECRAFT_TEST_SUPPORT_H
#define STAGECRAFT_TEST_SUPPORT_H

#include "stagecraft/stage.h"
#include <SDL3/SDL.h>
#include <cstdint>
#include <cstdio>
#include <vector>

/* Headless, unthrottled stage with sleeping disabled */
static inline Stagecraft_StageConfig test_stage_config(void) {
    Stagecraft_StageConfig config = STAGECRAFT_STAGE_DEFAULT;
    config.width = 400;
    config.height = 300;
    config.headless = true;
    config.cap_frame_rate = false;
    config.sleep_time_threshold = -1.0f;
    return config;
}

static inline void test_drain_events(void) {
    SDL_PumpEvents();
    SDL_FlushEvents(SDL_EVENT_FIRST, SDL_EVENT_LAST);
}

static inline void put_le16(std::vector<uint8_t> &out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xFF));
    out.push_back((uint8_t)(v >> 8));
}

static inline void put_le32(std::vector<uint8_t> &out, uint32_t v) {
    for (int i = 0; i < 4; i++) out.push_back((uint8_t)((v >> (8 * i)) & 0xFF));
}

/* Solid-colour 24-bit BMP */
static inline bool write_test_bmp(const char *path, int width, int height, uint8_t r, uint8_t g, uint8_t b) {
    int row_size = (width * 3 + 3) & ~3;
    uint32_t data_size = (uint32_t)(row_size * height);

    std::vector<uint8_t> bytes;
    bytes.push_back('B');
    bytes.push_back('M');
    put_le32(bytes, 54 + data_size);
    put_le32(bytes, 0);
    put_le32(bytes, 54);

    put_le32(bytes, 40);
    put_le32(bytes, (uint32_t)width);
    put_le32(bytes, (uint32_t)height);
    put_le16(bytes, 1);
    put_le16(bytes, 24);
    put_le32(bytes, 0);
    put_le32(bytes, data_size);
    put_le32(bytes, 2835);
    put_le32(bytes, 2835);
    put_le32(bytes, 0);
    put_le32(bytes, 0);

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            bytes.push_back(b);
            bytes.push_back(g);
            bytes.push_back(r);
        }
        for (int p = width * 3; p < row_size; p++) bytes.push_back(0);
    }

    FILE *fp = std::fopen(path, "wb");
    if (!fp) return false;
    size_t written = std::fwrite(bytes.data(), 1, bytes.size(), fp);
    std::fclose(fp);
    return written == bytes.size();
}

#endif /* STAGECRAFT_TEST_SUPPORT_H */
