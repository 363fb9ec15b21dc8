#pragma once

#include "permit/v1/permission_change.pb.h"
