/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_core_CNonCopyable_h
#define INCLUDED_segreg_core_CNonCopyable_h

#include <core/ImportExport.h>

namespace segreg {
namespace core {

//! \brief
//! Base for classes which must not be copied.
//!
//! DESCRIPTION:\n
//! Inherit privately from this class to delete the copy constructor and
//! copy assignment of the derived class. Used for the logger singleton and
//! the thread pool executors.
class CORE_EXPORT CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_segreg_core_CNonCopyable_h
