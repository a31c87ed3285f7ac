/*
 * Copyright (c) 2026 The RCSV Authors
 *
 * This file is part of the RCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file rcsv.h
 * @brief Record CSV (RCSV) Library - Main Header
 *
 * A C++20 header-only library that converts between sequences of typed
 * records and CSV text, in both directions.
 *
 * This header includes all RCSV components:
 * - Culture, Decimal, DateTime: culture-aware scalar types
 * - Value, ValueType, ValueTraits: type-erased field values
 * - Tokenizer: CSV line grammar
 * - FieldCodec: scalar <-> text conversion
 * - Schema: record field descriptors
 * - MapColumnWriter, HeaderBinding: dynamic columns of map fields
 * - RecordWriter / serialize(), RecordReader / deserialize()
 */

// Core definitions first
#include "definitions.h"
#include "errors.h"

// Core component declarations
#include "culture.h"
#include "date_time.h"
#include "decimal.h"
#include "field_codec.h"
#include "map_columns.h"
#include "options.h"
#include "ordered_map.h"
#include "record_reader.h"
#include "record_writer.h"
#include "schema.h"
#include "tokenizer.h"
#include "value.h"
#include "value_traits.h"

// Include implementations
#include "culture.hpp"
#include "date_time.hpp"
#include "decimal.hpp"
#include "field_codec.hpp"
#include "map_columns.hpp"
#include "record_reader.hpp"
#include "record_writer.hpp"
#include "schema.hpp"
#include "tokenizer.hpp"
#include "value.hpp"
