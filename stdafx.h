// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
// stdafx.h : include file for standard system include files,
// or project specific include files that are used frequently, but
// are changed infrequently
//

#pragma once

#define NOMINMAX

#ifndef BOOST_BIND_GLOBAL_PLACEHOLDERS
#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#endif

#include <frantic/strings/tstring.hpp>

#pragma warning( push, 3 )
#pragma warning( disable : 4512 )
#include <boost/config.hpp>
#include <boost/shared_ptr.hpp>
#pragma warning( pop )

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>
