// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"
#include "atres_exception.hpp"
#include "atres_helpers.hpp"
#include "atres_list.hpp"
