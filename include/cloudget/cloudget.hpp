// Copyright (c) 2024, cloudget Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CLOUDGET_API_VERSION_HPP
#define CLOUDGET_API_VERSION_HPP

// Project version
#define CLOUDGET_VERSION_MAJOR 0
#define CLOUDGET_VERSION_MINOR 3
#define CLOUDGET_VERSION_PATCH 0

// Binary version
#define CLOUDGET_BINARY_CURRENT 0
#define CLOUDGET_BINARY_REVISION 0
#define CLOUDGET_BINARY_AGE 1

#define CLOUDGET_VERSION_STRING "0.3.0"

#endif
