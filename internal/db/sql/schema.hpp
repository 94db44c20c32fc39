#pragma once

namespace cpandb::db::sql {

/*
  Final schema of the index.

  Only the Entity Merger widens distribution; weight and volatility stay
  at 0 until the metrics pass backfills them.
*/

static constexpr const char* CREATE_AUTHOR =
    "CREATE TABLE author ("
    " author TEXT NOT NULL PRIMARY KEY,"
    " name TEXT NOT NULL"
    ");";

static constexpr const char* CREATE_DISTRIBUTION =
    "CREATE TABLE distribution ("
    " distribution TEXT NOT NULL PRIMARY KEY,"
    " version TEXT NULL,"
    " author TEXT NOT NULL,"
    " meta INTEGER NOT NULL,"
    " license TEXT NULL,"
    " release TEXT NOT NULL,"
    " uploaded TEXT NULL,"
    " pass INTEGER NULL,"
    " fail INTEGER NULL,"
    " unknown INTEGER NULL,"
    " na INTEGER NULL,"
    " rating TEXT NULL,"
    " ratings INTEGER NOT NULL,"
    " weight INTEGER NOT NULL,"
    " volatility INTEGER NOT NULL,"
    " FOREIGN KEY ( author ) REFERENCES author ( author )"
    ");";

static constexpr const char* CREATE_MODULE =
    "CREATE TABLE module ("
    " module TEXT NOT NULL PRIMARY KEY,"
    " version TEXT NULL,"
    " distribution TEXT NOT NULL,"
    " FOREIGN KEY ( distribution ) REFERENCES distribution ( distribution )"
    ");";

static constexpr const char* CREATE_DEPENDENCY =
    "CREATE TABLE dependency ("
    " distribution TEXT NOT NULL,"
    " dependency TEXT NOT NULL,"
    " phase TEXT NOT NULL,"
    " core REAL NULL,"
    " PRIMARY KEY ( distribution, dependency, phase ),"
    " FOREIGN KEY ( distribution ) REFERENCES distribution ( distribution ),"
    " FOREIGN KEY ( dependency ) REFERENCES distribution ( distribution )"
    ");";

// module is not a foreign key: releases may require modules the index
// does not know about, and those declarations are kept.
static constexpr const char* CREATE_REQUIRES =
    "CREATE TABLE requires ("
    " distribution TEXT NOT NULL,"
    " module TEXT NOT NULL,"
    " version TEXT NULL,"
    " phase TEXT NOT NULL,"
    " PRIMARY KEY ( distribution, module, phase ),"
    " FOREIGN KEY ( distribution ) REFERENCES distribution ( distribution )"
    ");";

static constexpr const char* CREATE_TICKET =
    "CREATE TABLE ticket ("
    " id INTEGER NOT NULL,"
    " distribution TEXT NOT NULL,"
    " subject TEXT NOT NULL,"
    " status TEXT NOT NULL,"
    " severity TEXT NOT NULL,"
    " created TEXT NOT NULL,"
    " updated TEXT NOT NULL,"
    " PRIMARY KEY ( id ),"
    " FOREIGN KEY ( distribution ) REFERENCES distribution ( distribution )"
    ");";

// Intermediate module-level declarations, dropped after finalization.
static constexpr const char* CREATE_T_REQUIRES =
    "CREATE TABLE t_requires ("
    " distribution TEXT NOT NULL,"
    " module TEXT NOT NULL,"
    " version TEXT NULL,"
    " phase TEXT NOT NULL,"
    " core REAL NULL"
    ");";

}
