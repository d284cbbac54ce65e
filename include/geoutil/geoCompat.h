//
// geoCompat.h
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "fleece/CompilerSupport.h"

// Type-checking for printf-style vararg functions, and branch hints:
#ifdef _MSC_VER
#    ifndef __printflike
#        define __printflike(A, B)
#    endif
#    ifndef _usuallyFalse
#        define _usuallyFalse(VAL) (VAL)
#    endif
#else
#    ifndef __printflike
#        define __printflike(fmtarg, firstvararg) __attribute__((__format__(__printf__, fmtarg, firstvararg)))
#    endif
#    ifndef _usuallyFalse
#        define _usuallyFalse(VAL) __builtin_expect(VAL, false)
#    endif
#endif
