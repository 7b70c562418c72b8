#pragma once

// TFRECORD_PUBLIC marks every public class and free function. Define it before including any
// tfrecord header to control symbol visibility yourself. By default, symbols are exported from
// the translation unit that defines TFRECORD_IMPLEMENTATION (and imported elsewhere on Windows).
#ifndef TFRECORD_PUBLIC
#  if defined _WIN32 || defined __CYGWIN__
#    if defined TFRECORD_IMPLEMENTATION
#      define TFRECORD_PUBLIC __declspec(dllexport)
#    else
#      define TFRECORD_PUBLIC __declspec(dllimport)
#    endif
#  elif defined __GNUC__
#    define TFRECORD_PUBLIC __attribute__((visibility("default")))
#  else
#    define TFRECORD_PUBLIC
#  endif
#endif
