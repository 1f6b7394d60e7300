#include "stratify/fix/wrapper_templates.hpp"
#include <array>

namespace stratify {

namespace {

constexpr std::string_view MVNW_SCRIPT = R"MVNW(#!/bin/sh
# ----------------------------------------------------------------------------
# Maven Wrapper startup script (only-script distribution type)
#
# Optional ENV vars
#   JAVA_HOME    - location of a JDK home dir
#   MVNW_REPOURL - repo url base for downloading the maven distribution
#   MVNW_VERBOSE - true: enable verbose log
# ----------------------------------------------------------------------------

set -euf

verbose() { :; }
[ "${MVNW_VERBOSE-}" != true ] || verbose() { printf %s\\n "${1-}"; }

die() {
  printf %s\\n "$1" >&2
  exit 1
}

basedir="$(cd "$(dirname "$0")" && pwd)"
properties="$basedir/.mvn/wrapper/maven-wrapper.properties"
[ -f "$properties" ] || die "cannot read $properties"

distributionUrl=
while IFS="=" read -r key value; do
  case "${key-}" in
  distributionUrl) distributionUrl="$(printf "%s" "${value-}" | tr -d '[:space:]')" ;;
  esac
done <"$properties"
[ -n "$distributionUrl" ] || die "cannot read distributionUrl property in $properties"

if [ -n "${MVNW_REPOURL-}" ]; then
  distributionUrl="$MVNW_REPOURL/org/apache/maven/${distributionUrl#*/org/apache/maven/}"
fi

distributionName="${distributionUrl##*/}"
distributionDir="${distributionName%-bin.zip}"
MAVEN_USER_HOME="${MAVEN_USER_HOME:-${HOME}/.m2}"
MAVEN_HOME="$MAVEN_USER_HOME/wrapper/dists/$distributionDir"

if [ ! -d "$MAVEN_HOME" ]; then
  verbose "Couldn't find MAVEN_HOME, downloading $distributionUrl"
  tmpdir="$(mktemp -d)" || die "cannot create temp dir"
  trap 'rm -rf -- "$tmpdir"' EXIT
  if command -v curl >/dev/null; then
    curl -f -L -o "$tmpdir/$distributionName" "$distributionUrl" || die "cannot download $distributionUrl"
  elif command -v wget >/dev/null; then
    wget -q -O "$tmpdir/$distributionName" "$distributionUrl" || die "cannot download $distributionUrl"
  else
    die "neither curl nor wget is available to download $distributionUrl"
  fi
  command -v unzip >/dev/null || die "unzip is required to install $distributionName"
  unzip -q "$tmpdir/$distributionName" -d "$tmpdir" || die "cannot unzip $distributionName"
  mkdir -p "${MAVEN_HOME%/*}"
  mv -- "$tmpdir/$distributionDir" "$MAVEN_HOME" || [ -d "$MAVEN_HOME" ] || die "cannot install $MAVEN_HOME"
fi

exec "$MAVEN_HOME/bin/mvn" "$@"
)MVNW";

constexpr std::string_view MVNW_BATCH_SCRIPT = R"MVNW(<# : batch portion
@REM ----------------------------------------------------------------------------
@REM Maven Wrapper startup batch script (only-script distribution type)
@REM
@REM Optional ENV vars
@REM   MVNW_REPOURL - repo url base for downloading the maven distribution
@REM   MVNW_VERBOSE - true: enable verbose log
@REM ----------------------------------------------------------------------------
@IF "%__MVNW_ARG0_NAME__%"=="" (SET __MVNW_ARG0_NAME__=%~nx0)
@SET __MVNW_CMD__=
@SET __MVNW_ERROR__=
@SET __MVNW_PSMODULEP_SAVE=%PSModulePath%
@SET PSModulePath=
@FOR /F "usebackq tokens=1* delims==" %%A IN (`powershell -noprofile "& {$scriptDir='%~dp0'; $script='%__MVNW_ARG0_NAME__%'; icm -ScriptBlock ([Scriptblock]::Create((Get-Content -Raw '%~f0'))) -NoNewScope}"`) DO @(
  IF "%%A"=="MVN_CMD" (set __MVNW_CMD__=%%B) ELSE IF "%%B"=="" (echo %%A) ELSE (echo %%A=%%B)
)
@SET PSModulePath=%__MVNW_PSMODULEP_SAVE%
@SET __MVNW_PSMODULEP_SAVE=
@SET __MVNW_ARG0_NAME__=
@IF NOT "%__MVNW_CMD__%"=="" (%__MVNW_CMD__% %*)
@IF "%__MVNW_CMD__%"=="" (echo Cannot start maven from wrapper >&2 && exit /b 1)
@GOTO :EOF
: end batch / begin powershell #>

$ErrorActionPreference = "Stop"
if ($env:MVNW_VERBOSE -eq "true") {
  $VerbosePreference = "Continue"
}

$distributionUrl = (Get-Content -Raw "$scriptDir/.mvn/wrapper/maven-wrapper.properties" | ConvertFrom-StringData).distributionUrl
if (!$distributionUrl) {
  Write-Error "cannot read distributionUrl property in $scriptDir/.mvn/wrapper/maven-wrapper.properties"
}
if ($env:MVNW_REPOURL) {
  $distributionUrl = "$env:MVNW_REPOURL/org/apache/maven/$($distributionUrl -replace '^.*/org/apache/maven/','')"
}

$distributionUrlName = $distributionUrl -replace '^.*/',''
$distributionUrlNameMain = $distributionUrlName -replace '-bin\.zip$',''
$MAVEN_USER_HOME = if ($env:MAVEN_USER_HOME) { $env:MAVEN_USER_HOME } else { "$HOME/.m2" }
$MAVEN_HOME = "$MAVEN_USER_HOME/wrapper/dists/$distributionUrlNameMain"

if (Test-Path -Path "$MAVEN_HOME" -PathType Container) {
  Write-Verbose "found existing MAVEN_HOME at $MAVEN_HOME"
  Write-Output "MVN_CMD=$MAVEN_HOME/bin/mvn.cmd"
  exit $?
}

$TMP_DOWNLOAD_DIR = New-TemporaryFile
Remove-Item $TMP_DOWNLOAD_DIR
New-Item -ItemType Directory -Path $TMP_DOWNLOAD_DIR | Out-Null

try {
  Write-Verbose "Downloading from: $distributionUrl"
  $webclient = New-Object System.Net.WebClient
  $webclient.DownloadFile($distributionUrl, "$TMP_DOWNLOAD_DIR/$distributionUrlName") | Out-Null
  Expand-Archive "$TMP_DOWNLOAD_DIR/$distributionUrlName" -DestinationPath "$TMP_DOWNLOAD_DIR" | Out-Null
  New-Item -ItemType Directory -Force -Path (Split-Path $MAVEN_HOME -Parent) | Out-Null
  Move-Item -Path "$TMP_DOWNLOAD_DIR/$distributionUrlNameMain" -Destination $MAVEN_HOME | Out-Null
} finally {
  Remove-Item $TMP_DOWNLOAD_DIR -Recurse -Force -ErrorAction SilentlyContinue
}

Write-Output "MVN_CMD=$MAVEN_HOME/bin/mvn.cmd"
)MVNW";

constexpr std::string_view WRAPPER_PROPERTIES_CONTENT = R"MVNW(wrapperVersion=3.3.2
distributionType=only-script
distributionUrl=https://repo.maven.apache.org/maven2/org/apache/maven/apache-maven/3.9.9/apache-maven-3.9.9-bin.zip
)MVNW";

constexpr std::array ASSETS = {
    WrapperAsset{.relative_path = WRAPPER_SCRIPT, .content = MVNW_SCRIPT, .executable = true},
    WrapperAsset{.relative_path = WRAPPER_BATCH_SCRIPT, .content = MVNW_BATCH_SCRIPT},
    WrapperAsset{.relative_path = WRAPPER_PROPERTIES, .content = WRAPPER_PROPERTIES_CONTENT},
};

} // namespace

auto wrapper_assets() -> std::span<const WrapperAsset> {
    return ASSETS;
}

} // namespace stratify
