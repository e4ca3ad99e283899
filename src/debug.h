/*
 * Copyright 2000, OpenLDAP Foundation, All Rights Reserved.
 * COPYING RESTRICTIONS APPLY, see COPYRIGHT file
 */

#ifndef LDAPSCHEMA_DEBUG_H
#define LDAPSCHEMA_DEBUG_H
#include <iostream>

#define LDAPSCHEMA_DEBUG_NONE         0x0000
#define LDAPSCHEMA_DEBUG_TRACE        0x0001
#define LDAPSCHEMA_DEBUG_CONSTRUCT    0x0002
#define LDAPSCHEMA_DEBUG_DESTROY      0x0004
#define LDAPSCHEMA_DEBUG_PARAMETER    0x0008
#define LDAPSCHEMA_DEBUG_ANY -1

/*
 * active mask, set through LDAPSchemaOptions::setDebugLevel()
 */
extern int ldapschema_debug_level;

#define LDAPSCHEMA_DEBUG(level, arg)       \
    if((level) & ldapschema_debug_level){     \
        std::cerr  << arg ;          \
    }

#endif // LDAPSCHEMA_DEBUG_H
