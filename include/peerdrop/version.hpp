#pragma once

#define PEERDROP_VERSION_MAJOR 0
#define PEERDROP_VERSION_MINOR 1
#define PEERDROP_VERSION_PATCH 0
#define PEERDROP_VERSION "0.1.0"
