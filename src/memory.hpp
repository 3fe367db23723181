#ifndef TWCSS_MEMORY_H
#define TWCSS_MEMORY_H

#include "memory/allocator.hpp"
#include "memory/shared_ptr.hpp"

#endif
