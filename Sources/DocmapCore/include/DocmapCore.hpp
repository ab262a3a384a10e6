#pragma once

// Umbrella header for the docmap object-document mapper.

#include "docmap/log.hpp"
#include "docmap/errors.hpp"
#include "docmap/types.hpp"
#include "docmap/introspection.hpp"
#include "docmap/object.hpp"
#include "docmap/schema.hpp"
#include "docmap/inflector.hpp"
#include "docmap/metadata_cache.hpp"
#include "docmap/validation.hpp"
#include "docmap/reference.hpp"
#include "docmap/transport.hpp"
#include "docmap/sqlite_transport.hpp"
#include "docmap/extractor.hpp"
#include "docmap/registry.hpp"
#include "docmap/serializer.hpp"
#include "docmap/events.hpp"
#include "docmap/diff.hpp"
#include "docmap/hydrator.hpp"
#include "docmap/mapper.hpp"
