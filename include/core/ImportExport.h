/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_core_ImportExport_h
#define INCLUDED_segreg_core_ImportExport_h

// Symbols are only exported explicitly when building a Windows DLL. On other
// platforms the default visibility is used.
#if defined(Windows)
#ifdef BUILDING_libSegregCore
#define CORE_EXPORT __declspec(dllexport)
#else
#define CORE_EXPORT __declspec(dllimport)
#endif
#else
#define CORE_EXPORT
#endif

#endif // INCLUDED_segreg_core_ImportExport_h
