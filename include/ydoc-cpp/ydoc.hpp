/// @file ydoc.hpp
/// @brief Umbrella header for the ydoc-cpp library.
///
/// Include this single header for access to all public types: the shared
/// tree (Document, Transaction, events), the reconcilers, the scheduler and
/// the document kinds UnicodeDoc (alias FileDoc), BlobDoc and NotebookDoc.

#pragma once

#include <ydoc-cpp/base_doc.hpp>
#include <ydoc-cpp/blob_doc.hpp>
#include <ydoc-cpp/cell.hpp>
#include <ydoc-cpp/cell_reconciler.hpp>
#include <ydoc-cpp/diagnostics.hpp>
#include <ydoc-cpp/document.hpp>
#include <ydoc-cpp/error.hpp>
#include <ydoc-cpp/event.hpp>
#include <ydoc-cpp/json.hpp>
#include <ydoc-cpp/notebook_doc.hpp>
#include <ydoc-cpp/scheduler.hpp>
#include <ydoc-cpp/text_diff.hpp>
#include <ydoc-cpp/text_reconciler.hpp>
#include <ydoc-cpp/transaction.hpp>
#include <ydoc-cpp/types.hpp>
#include <ydoc-cpp/unicode_doc.hpp>
#include <ydoc-cpp/value.hpp>
