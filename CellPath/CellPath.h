#ifndef _CellPath_CellPath_h_
#define _CellPath_CellPath_h_

// Standard library includes
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <cstddef>
#include <cmath>
#include <algorithm>
#include <array>
#include <functional>
#include <iostream>
#include <iomanip>
#include <limits>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <tuple>
#include <variant>
#include <vector>

// System includes
#include <unistd.h>

#include "common.h"
#include "utils.h"
#include "config.h"
#include "lattice_spec.h"
#include "containment.h"
#include "path_builder.h"
#include "grid_selector.h"
#include "cards.h"
#include "grid_view.h"
#include "wizard.h"


#endif
