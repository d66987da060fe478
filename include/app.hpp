/**
 * @file app.hpp
 * @brief Application-wide SK8 session instance
 * @version 1.0
 * @date 2026-10-18
 *
 */
#ifndef APP_INCLUDE_APP_HEADER_
#define APP_INCLUDE_APP_HEADER_

#include <sk8_device.hpp>

// Session used by main and the shell front end
sk8::Sk8Device &app_device(void);

#endif // APP_INCLUDE_APP_HEADER_
