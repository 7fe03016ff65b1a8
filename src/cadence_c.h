#pragma once

/// @file cadence_c.h
/// @brief C API for libcadence.
/// @details Provides a C-compatible interface for embedding the analysis session in a
///          foreign host shell (render loop, audio player, visualizer).

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Error codes
typedef enum {
  CADENCE_OK = 0,
  CADENCE_ERROR_FILE_NOT_FOUND = 1,
  CADENCE_ERROR_INVALID_FORMAT = 2,
  CADENCE_ERROR_DECODE_FAILED = 3,
  CADENCE_ERROR_INVALID_PARAMETER = 4,
  CADENCE_ERROR_OUT_OF_MEMORY = 5,
  CADENCE_ERROR_INVALID_CONFIGURATION = 6,
  CADENCE_ERROR_SOURCE_UNAVAILABLE = 7,
  CADENCE_ERROR_UNKNOWN = 99
} CadenceError;

// Playback phase
typedef enum {
  CADENCE_PHASE_IDLE = 0,
  CADENCE_PHASE_PLAYING = 1,
  CADENCE_PHASE_PAUSED = 2
} CadencePhase;

// Opaque types
typedef struct CadenceSource CadenceSource;
typedef struct CadenceSession CadenceSession;

// Session tuning. Fill with cadence_config_default() and override fields as needed.
typedef struct {
  int fft_size;
  float smoothing;
  float peak_threshold;
  float rise_ratio;
  double min_peak_distance;
  double beat_tolerance;
  uint32_t default_bpm;
} CadenceConfig;

// Per-tick analysis result
typedef struct {
  float bass;
  float mid;
  float high;
  float amplitude;
  int on_beat;
  uint32_t bpm;
  double beat_time;
  double timestamp;
  CadenceError status;
} CadenceFrame;

// Source functions
CadenceError cadence_source_from_buffer(const float* data, size_t length, int sample_rate,
                                        CadenceSource** out);
CadenceError cadence_source_from_memory(const uint8_t* data, size_t length, CadenceSource** out);
CadenceError cadence_source_from_file(const char* path, CadenceSource** out);
CadenceError cadence_source_create_stream(int sample_rate, size_t capacity, CadenceSource** out);
void cadence_source_free(CadenceSource* source);

// Buffer sources: move the playhead. Stream sources: append captured samples.
CadenceError cadence_source_seek(CadenceSource* source, double seconds);
CadenceError cadence_source_push(CadenceSource* source, const float* samples, size_t length);
// Playback readback for buffer sources (0 for streams).
double cadence_source_position(const CadenceSource* source);
int cadence_source_ended(const CadenceSource* source);
double cadence_source_duration(const CadenceSource* source);
int cadence_source_sample_rate(const CadenceSource* source);

// Session functions
void cadence_config_default(CadenceConfig* config);
CadenceError cadence_session_create(const CadenceConfig* config, CadenceSession** out);
void cadence_session_free(CadenceSession* session);

// The source must stay alive while it is registered with a session. The active source id
// cannot be re-registered or removed until the session switches away or stops.
CadenceError cadence_session_add_source(CadenceSession* session, const char* source_id,
                                        const CadenceSource* source);
CadenceError cadence_session_remove_source(CadenceSession* session, const char* source_id);

CadenceError cadence_session_start(CadenceSession* session, const char* source_id,
                                   int preserve_tempo);
CadenceError cadence_session_pause(CadenceSession* session);
CadenceError cadence_session_resume(CadenceSession* session);
CadenceError cadence_session_switch_source(CadenceSession* session, const char* source_id,
                                           int preserve_tempo);
CadenceError cadence_session_stop(CadenceSession* session);
CadenceError cadence_session_advance(CadenceSession* session, double now, CadenceFrame* out);

CadencePhase cadence_session_phase(const CadenceSession* session);

// Copies the byte spectrum of the last frame; returns the number of bins written.
size_t cadence_session_spectrum(const CadenceSession* session, uint8_t* out, size_t capacity);

// Error handling
const char* cadence_error_message(CadenceError error);

// Version
const char* cadence_version(void);

#ifdef __cplusplus
}
#endif
