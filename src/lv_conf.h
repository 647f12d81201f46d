/**
 * lvgl configuration for the off-screen chart canvas.
 * Only the options that differ from lv_conf_internal.h defaults are set.
 */
#ifndef LV_CONF_H
#define LV_CONF_H

/*====================
   COLOR SETTINGS
 *====================*/

#define LV_COLOR_DEPTH 16

/*=========================
   STDLIB WRAPPER SETTINGS
 *=========================*/

#define LV_USE_STDLIB_MALLOC    LV_STDLIB_CLIB
#define LV_USE_STDLIB_STRING    LV_STDLIB_CLIB
#define LV_USE_STDLIB_SPRINTF   LV_STDLIB_CLIB

/*====================
   HAL SETTINGS
 *====================*/

/* No refresh loop runs; the canvas is drawn synchronously. */
#define LV_DEF_REFR_PERIOD  33
#define LV_DPI_DEF          130

/*=================
 * OPERATING SYSTEM
 *=================*/

#define LV_USE_OS   LV_OS_NONE

/*========================
 * RENDERING CONFIGURATION
 *========================*/

#define LV_USE_DRAW_SW 1
#define LV_DRAW_SW_DRAW_UNIT_CNT 1
#define LV_DRAW_SW_COMPLEX 1

/*=====================
 * LOGGING
 *=====================*/

#define LV_USE_LOG 0

/*==================
 *   FONT USAGE
 *===================*/

#define LV_FONT_MONTSERRAT_14 1
#define LV_FONT_MONTSERRAT_20 1
#define LV_FONT_UNSCII_8      1
#define LV_FONT_UNSCII_16     1

#define LV_FONT_DEFAULT &lv_font_montserrat_14

/*==================
 * WIDGETS
 *================*/

#define LV_USE_CANVAS 1
#define LV_USE_LABEL  1
#define LV_USE_IMAGE  1

/*==================
 * THEMES
 *==================*/

#define LV_USE_THEME_DEFAULT 0

#endif /*LV_CONF_H*/
