#ifndef SPLITJOIN_SPLITJOIN_H
#define SPLITJOIN_SPLITJOIN_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum splitjoin_status {
  SPLITJOIN_OK = 0,
  SPLITJOIN_ERR_INVALID_ARGUMENT = 1,
  SPLITJOIN_ERR_SOURCE = 2,
  SPLITJOIN_ERR_CAPACITY = 3,
  SPLITJOIN_ERR_BACKEND = 4
} splitjoin_status;

const char * splitjoin_status_string(int32_t status);

// Fixed message used by the splitjoin executable. NUL-terminated, static storage.
const char * splitjoin_default_message(void);

// Splits `text` on whitespace, joins with a single space and capitalizes the
// first character. `out` receives the result and a NUL terminator.
// `out_len` receives the required length (terminator excluded) even when
// SPLITJOIN_ERR_CAPACITY is returned.
splitjoin_status splitjoin_transform(
  const char * text,
  size_t text_len,
  char * out,
  size_t out_capacity,
  size_t * out_len);

#ifdef __cplusplus
}
#endif

#endif  // SPLITJOIN_SPLITJOIN_H
