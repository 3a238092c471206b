#pragma once

#include "key_matrix.h"

// Combinational row read-back: row r is active if any closed key in row r
// sits on an asserted column. Any key/column combination is legal.
RowActivity detectRows(KeyMatrix keys, ColumnDrive columns);
