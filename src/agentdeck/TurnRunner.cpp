/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TurnRunner.h"

#include "moc_TurnRunner.cpp"
