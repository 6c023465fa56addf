#ifndef ISOTLV_LOG_H
#define ISOTLV_LOG_H

#include <esp_log.h>

#ifndef DOXYGEN_SHOULD_SKIP_THIS
#ifdef __cplusplus
extern "C" {
#endif

#define ISOTLV_DEFAULT_LOG_PREFIX "ISOTLV"

#ifndef ISOTLV_LOG_PREFIX
#define ISOTLV_LOG_PREFIX ISOTLV_DEFAULT_LOG_PREFIX
#endif
#define ISOTLV_LOGE(format, ...) ESP_LOGE(ISOTLV_LOG_PREFIX, format, ##__VA_ARGS__)
#define ISOTLV_LOGW(format, ...) ESP_LOGW(ISOTLV_LOG_PREFIX, format, ##__VA_ARGS__)
#define ISOTLV_LOGI(format, ...) ESP_LOGI(ISOTLV_LOG_PREFIX, format, ##__VA_ARGS__)
#define ISOTLV_LOGD(format, ...) ESP_LOGD(ISOTLV_LOG_PREFIX, format, ##__VA_ARGS__)
#define ISOTLV_LOGV(format, ...) ESP_LOGV(ISOTLV_LOG_PREFIX, format, ##__VA_ARGS__)

#ifdef __cplusplus
}
#endif
#endif
#endif//ISOTLV_LOG_H
