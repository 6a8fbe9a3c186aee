/**
 * @file tabedit.h
 * @brief tabedit - Edit delimited tables as aligned text and validate the result.
 * @version 0.1.0
 *
 * This is the main public header for the tabedit library. Include this single
 * header to access all public functionality.
 */

#ifndef TABEDIT_H
#define TABEDIT_H

#define TABEDIT_VERSION_MAJOR 0
#define TABEDIT_VERSION_MINOR 1
#define TABEDIT_VERSION_PATCH 0
#define TABEDIT_VERSION_STRING "0.1.0"

#include "tabedit/dialect.h"
#include "tabedit/edit_session.h"
#include "tabedit/editor.h"
#include "tabedit/error.h"
#include "tabedit/io_util.h"
#include "tabedit/table.h"
#include "tabedit/table_diff.h"
#include "tabedit/table_parser.h"
#include "tabedit/validator.h"
#include "tabedit/writer.h"

#endif // TABEDIT_H
