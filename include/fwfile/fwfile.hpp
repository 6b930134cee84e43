#pragma once
/// @file fwfile.hpp
/// @brief Single include for the fixed-width editing library

#include "Errors.hpp"
#include "access/FieldAccessor.hpp"
#include "access/TransactionAppender.hpp"
#include "codec/Codec.hpp"
#include "codec/FieldCodec.hpp"
#include "record/Record.hpp"
#include "repository/FileTransaction.hpp"
#include "schema/FieldSpec.hpp"
#include "schema/Schema.hpp"
#include "schema/SchemaLoader.hpp"
#include "util/Logger.hpp"
