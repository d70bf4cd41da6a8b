#ifndef TOOLBRIDGE_VERSION_HPP_
#define TOOLBRIDGE_VERSION_HPP_

#define TOOLBRIDGE_VERSION_MAJOR 0
#define TOOLBRIDGE_VERSION_MINOR 1
#define TOOLBRIDGE_VERSION_PATCH 0
#define TOOLBRIDGE_VERSION "0.1.0"

#endif // TOOLBRIDGE_VERSION_HPP_
