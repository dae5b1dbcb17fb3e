
//    --------------------------------------------------------------------
//
//    This file is part of pwruse.
//
//    PWRUSE is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    pwruse is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with pwruse. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------


#ifndef __PWRUSE_H__
#define __PWRUSE_H__

#include <cstddef>

#include "defs/defs.h"
#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <Eigen/Dense>

#include "series/series.h"

#include "dsp/iir.h"
#include "dsp/conv.h"

#include "usage/usage.h"

#include "db/db.h"

#include <iostream>

extern globals global;
extern writer_t writer;
extern logger_t logger;

#endif
