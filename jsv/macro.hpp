/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Source location macros used by the exception helpers

**************************************************/

#ifndef JSV_MACRO_HPP
#define JSV_MACRO_HPP

#define JSV_FILE_NAME __FILE__
#define JSV_FILE_LINE __LINE__
#define JSV_FUNC_NAME __func__

#endif  // JSV_MACRO_HPP
