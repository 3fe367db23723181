#ifndef TWCSS_H
#define TWCSS_H

// #define DEBUG 1

// include API headers
#include <twcss/base.h>
#include <twcss/ast.h>

#endif
