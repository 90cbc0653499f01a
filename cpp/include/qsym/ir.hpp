// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <qsym/ir/algorithms/canonicalizer.hpp>
#include <qsym/ir/algorithms/flatten.hpp>
#include <qsym/ir/data/canonicalized.hpp>
#include <qsym/ir/data/expression.hpp>
#include <qsym/ir/data/pauli_string.hpp>
#include <qsym/ir/data/settings.hpp>
#include <qsym/ir/data/symbol.hpp>
