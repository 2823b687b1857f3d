/**
 * @file RftVersion.hpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * Defines the current RFT version.
 * It is based off of boost/version.hpp
 */

#ifndef RFT_VERSION_HPP
#define RFT_VERSION_HPP

 //  RFT_VERSION % 100 is the patch level
 //  RFT_VERSION / 100 % 1000 is the minor version
 //  RFT_VERSION / 100000 is the major version
 //  00.000.00 where MAJOR_MINOR_PATCH

#define RFT_VERSION 100000

#define RFT_VERSION_PATCH (RFT_VERSION % 100)
#define RFT_VERSION_MINOR ((RFT_VERSION / 100) % 1000)
#define RFT_VERSION_MAJOR (RFT_VERSION / 100000)

#endif
