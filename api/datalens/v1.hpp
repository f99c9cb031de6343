#pragma once

#include "datalens/v1/types.pb.h"
#include "datalens/v1/query.pb.h"
#include "datalens/v1/dependency.pb.h"
#include "datalens/v1/catalog.pb.h"
